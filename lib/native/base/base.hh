// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#pragma once

#include <algorithm>
#include <atomic>
#include <errno.h>
#include <functional>
#include <inttypes.h>
#include <limits.h>
#include <limits>
#include <memory>
#include <new>
#include <stddef.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <type_traits>
#include <utility>
#include <unistd.h>

namespace LD {

// ------------------------------------------------------------------------
// Config
// ------------------------------------------------------------------------

#if !defined(NDEBUG)
    #define LD_DEBUG
#endif

#define LD_HEAPARRAY_BASE_CAPACITY 8
#define LD_HEAPARRAY_GROWTH_FACTOR 2.0

#define LD_FMT_STRING_BASE_CAPACITY 256
#define LD_FMT_STRING_PRINT_BUFFER_SIZE 1024

// ------------------------------------------------------------------------
// Utility
// ------------------------------------------------------------------------

extern "C" const char *AppTarget;
extern "C" const char *AppVersion;

#if defined(__x86_64__) || defined(__aarch64__) || __riscv_xlen == 64 || defined(__loongarch64)
    typedef int64_t Size;
    #define LD_SIZE_MAX INT64_MAX
#elif defined(__unix__)
    typedef int32_t Size;
    #define LD_SIZE_MAX INT32_MAX
#else
    #error Machine architecture not supported
#endif

#if __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
    // Sane platform
#elif __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    #define LD_BIG_ENDIAN
#else
    #error This code base is not designed to support platforms with crazy endianness
#endif

#define LD_STRINGIFY_(a) #a
#define LD_STRINGIFY(a) LD_STRINGIFY_(a)
#define LD_CONCAT_(a, b) a ## b
#define LD_CONCAT(a, b) LD_CONCAT_(a, b)
#define LD_UNIQUE_NAME(prefix) LD_CONCAT(prefix, __LINE__)
#define LD_IGNORE (void)!

#define LD_PUSH_NO_WARNINGS \
    _Pragma("GCC diagnostic push") \
    _Pragma("GCC diagnostic ignored \"-Wall\"") \
    _Pragma("GCC diagnostic ignored \"-Wextra\"") \
    _Pragma("GCC diagnostic ignored \"-Wconversion\"") \
    _Pragma("GCC diagnostic ignored \"-Wsign-conversion\"") \
    _Pragma("GCC diagnostic ignored \"-Wunused-function\"") \
    _Pragma("GCC diagnostic ignored \"-Wunused-parameter\"")
#define LD_POP_NO_WARNINGS \
    _Pragma("GCC diagnostic pop")

extern "C" void AssertMessage(const char *filename, int line, const char *cond);

#define LD_CRITICAL(Cond, ...) \
    do { \
        if (!(Cond)) [[unlikely]] { \
            PrintLn(stderr, __VA_ARGS__); \
            abort(); \
        } \
    } while (false)
#if defined(LD_DEBUG)
    #define LD_ASSERT(Cond) \
        do { \
            if (!(Cond)) [[unlikely]] { \
                LD::AssertMessage(__FILE__, __LINE__, LD_STRINGIFY(Cond)); \
                abort(); \
            } \
        } while (false)
    #define LD_UNREACHABLE() \
        do { \
            LD::AssertMessage(__FILE__, __LINE__, "Reached code marked as UNREACHABLE"); \
            abort(); \
        } while (false)
#else
    #define LD_ASSERT(Cond) \
        do { \
            (void)sizeof(Cond); \
        } while (false)
    #define LD_UNREACHABLE() __builtin_unreachable()
#endif

#define LD_DELETE_COPY(Cls) \
    Cls(const Cls&) = delete; \
    Cls &operator=(const Cls&) = delete;

#define LD_SIZE(Type) ((LD::Size)sizeof(Type))
template <typename T, unsigned N>
char (&ComputeArraySize(T const (&)[N]))[N];
#define LD_LEN(Array) LD_SIZE(LD::ComputeArraySize(Array))

static constexpr inline uint16_t ReverseBytes(uint16_t u)
{
    return (uint16_t)(((u & 0x00FF) << 8) |
                      ((u & 0xFF00) >> 8));
}

static constexpr inline uint32_t ReverseBytes(uint32_t u)
{
    return ((u & 0x000000FF) << 24) |
           ((u & 0x0000FF00) << 8)  |
           ((u & 0x00FF0000) >> 8)  |
           ((u & 0xFF000000) >> 24);
}

#if defined(LD_BIG_ENDIAN)
template <typename T>
constexpr T LittleEndian(T v) { return ReverseBytes(v); }
#else
template <typename T>
constexpr T LittleEndian(T v) { return v; }
#endif

// Calling memcpy (and friends) with a NULL source pointer is undefined behavior
// even if length is 0. This is dumb, work around this.
static inline void *MemCpy(void *__restrict__ dest, const void *__restrict__ src, Size len)
{
    LD_ASSERT(len >= 0);

    if (len) {
        memcpy(dest, src, (size_t)len);
    }
    return dest;
}
static inline void *MemSet(void *dest, int c, Size len)
{
    LD_ASSERT(len >= 0);

    if (len) {
        memset(dest, c, (size_t)len);
    }
    return dest;
}

template <typename Fun>
class DeferGuard {
    LD_DELETE_COPY(DeferGuard)

    Fun f;
    bool enabled;

public:
    DeferGuard() = delete;
    DeferGuard(Fun f_, bool enable = true) : f(std::move(f_)), enabled(enable) {}
    ~DeferGuard()
    {
        if (enabled) {
            f();
        }
    }

    DeferGuard(DeferGuard &&other)
        : f(std::move(other.f)), enabled(other.enabled)
    {
        other.enabled = false;
    }

    void Disable() { enabled = false; }
};

// Honestly, I don't understand all the details in there, this comes from Andrei Alexandrescu.
// https://channel9.msdn.com/Shows/Going+Deep/C-and-Beyond-2012-Andrei-Alexandrescu-Systematic-Error-Handling-in-C
struct DeferGuardHelper {};
template <typename Fun>
DeferGuard<Fun> operator+(DeferGuardHelper, Fun &&f)
{
    return DeferGuard<Fun>(std::forward<Fun>(f));
}

// Write 'LD_DEFER { code };' to do something at the end of the current scope, you
// can use LD_DEFER_N(Name) if you need to disable the guard for some reason.
#define LD_DEFER \
    auto LD_UNIQUE_NAME(defer) = LD::DeferGuardHelper() + [&]()
#define LD_DEFER_N(Name) \
    auto Name = LD::DeferGuardHelper() + [&]()

// Heavily inspired from FunctionRef in LLVM
template<typename Fn> class FunctionRef;
template<typename Ret, typename ...Params>
class FunctionRef<Ret(Params...)> {
    Ret (*callback)(intptr_t callable, Params ...params) = nullptr;
    intptr_t callable;

    template<typename Callable>
    static Ret callback_fn(intptr_t callable, Params ...params)
        { return (*reinterpret_cast<Callable*>(callable))(std::forward<Params>(params)...); }

public:
    FunctionRef() = default;

    template <typename Callable>
    FunctionRef(Callable &&callable,
                std::enable_if_t<!std::is_same<std::remove_cv_t<std::remove_reference_t<Callable>>, FunctionRef>::value> * = nullptr,
                std::enable_if_t<std::is_void<Ret>::value ||
                                 std::is_convertible<decltype(std::declval<Callable>()(std::declval<Params>()...)),
                                                     Ret>::value> * = nullptr)
      : callback(callback_fn<typename std::remove_reference<Callable>::type>),
        callable(reinterpret_cast<intptr_t>(&callable)) {}

    Ret operator()(Params ...params) const
        { return callback(callable, std::forward<Params>(params)...); }

    bool IsValid() const { return callback; }
};

// ------------------------------------------------------------------------
// Memory
// ------------------------------------------------------------------------

// I'd love to make Span default to { nullptr, 0 } but unfortunately that makes
// it a non-POD and prevents putting it in a union.
template <typename T>
struct Span {
    T *ptr;
    Size len;

    Span() = default;
    constexpr Span(T &value) : ptr(&value), len(1) {}
    constexpr Span(std::initializer_list<T> l) : ptr(l.begin()), len((Size)l.size()) {}
    constexpr Span(T *ptr_, Size len_) : ptr(ptr_), len(len_) {}
    template <Size N>
    constexpr Span(T (&arr)[N]) : ptr(arr), len(N) {}

    constexpr T *begin() { return ptr; }
    constexpr const T *begin() const { return ptr; }
    constexpr T *end() { return ptr + len; }
    constexpr const T *end() const { return ptr + len; }

    constexpr bool IsValid() const { return ptr; }

    constexpr T &operator[](Size idx)
    {
        LD_ASSERT(idx >= 0 && idx < len);
        return ptr[idx];
    }
    constexpr const T &operator[](Size idx) const
    {
        LD_ASSERT(idx >= 0 && idx < len);
        return ptr[idx];
    }

    constexpr operator Span<const T>() const { return Span<const T>(ptr, len); }

    constexpr bool operator==(const Span &other) const
    {
        if (len != other.len)
            return false;

        for (Size i = 0; i < len; i++) {
            if (ptr[i] != other.ptr[i])
                return false;
        }

        return true;
    }
    constexpr bool operator!=(const Span &other) const { return !(*this == other); }

    constexpr Span Take(Size offset, Size sub_len) const
    {
        LD_ASSERT(sub_len >= 0 && sub_len <= len);
        LD_ASSERT(offset >= 0 && offset <= len - sub_len);

        Span<T> sub = { ptr + offset, sub_len };
        return sub;
    }
};

// Use strlen() to build Span<const char> instead of the template-based
// array constructor.
template <>
struct Span<const char> {
    const char *ptr;
    Size len;

    Span() = default;
    constexpr Span(const char &ch) : ptr(&ch), len(1) {}
    constexpr Span(const char *ptr_, Size len_) : ptr(ptr_), len(len_) {}
    template <Size N>
    Span(const char (&arr)[N]) : ptr(arr), len((Size)strnlen(arr, N)) {}
    constexpr Span(const char *const &str) : ptr(str), len(str ? (Size)__builtin_strlen(str) : 0) {}

    constexpr const char *begin() const { return ptr; }
    constexpr const char *end() const { return ptr + len; }

    constexpr bool IsValid() const { return ptr; }

    constexpr char operator[](Size idx) const
    {
        LD_ASSERT(idx >= 0 && idx < len);
        return ptr[idx];
    }

    // The implementation comes later, after TestStr() is available
    bool operator==(Span<const char> other) const;
    bool operator==(const char *other) const;
    bool operator!=(Span<const char> other) const { return !(*this == other); }
    bool operator!=(const char *other) const { return !(*this == other); }

    constexpr Span Take(Size offset, Size sub_len) const
    {
        LD_ASSERT(sub_len >= 0 && sub_len <= len);
        LD_ASSERT(offset >= 0 && offset <= len - sub_len);

        Span<const char> sub = { ptr + offset, sub_len };
        return sub;
    }
};

template <typename T>
static constexpr inline Span<T> MakeSpan(T *ptr, Size len)
{
    return Span<T>(ptr, len);
}
template <typename T>
static constexpr inline Span<T> MakeSpan(T *ptr, T *end)
{
    return Span<T>(ptr, end - ptr);
}
template <typename T, Size N>
static constexpr inline Span<T> MakeSpan(T (&arr)[N])
{
    return Span<T>(arr, N);
}

// ------------------------------------------------------------------------
// Collections
// ------------------------------------------------------------------------

template <typename T, Size N, Size AlignAs = alignof(T)>
class LocalArray {
public:
    alignas(AlignAs) T data[N];
    Size len = 0;

    typedef T value_type;
    typedef T *iterator_type;

    constexpr LocalArray() = default;
    constexpr LocalArray(std::initializer_list<T> l)
    {
        LD_ASSERT(l.size() <= N);
        for (const T &it: l) {
            data[len++] = it;
        }
    }

    void Clear()
    {
        for (Size i = 0; i < len; i++) {
            data[i] = T();
        }
        len = 0;
    }

    operator Span<T>() { return Span<T>(data, len); }
    operator Span<const T>() const { return Span<const T>(data, len); }

    T *begin() { return data; }
    const T *begin() const { return data; }
    T *end() { return data + len; }
    const T *end() const { return data + len; }

    Size Available() const { return N - len; }

    T &operator[](Size idx)
    {
        LD_ASSERT(idx >= 0 && idx < len);
        return data[idx];
    }
    const T &operator[](Size idx) const
    {
        LD_ASSERT(idx >= 0 && idx < len);
        return data[idx];
    }

    T *AppendDefault(Size count = 1)
    {
        LD_ASSERT(len <= N - count);

        T *first = data + len;
        for (Size i = 0; i < count; i++) {
            data[len++] = T();
        }

        return first;
    }

    T *Append(const T &value)
    {
        LD_ASSERT(len < N);

        T *it = data + len;
        *it = value;
        len++;

        return it;
    }
    T *Append(Span<const T> values)
    {
        LD_ASSERT(values.len <= N - len);

        T *it = data + len;
        for (Size i = 0; i < values.len; i++) {
            data[len + i] = values[i];
        }
        len += values.len;

        return it;
    }

    Span<T> Take(Size offset, Size sub_len) const
    {
        Span<T> span = Span<T>((T *)data, len);
        return span.Take(offset, sub_len);
    }
};

// Only for trivially copyable types, which is all we need around here
template <typename T>
class HeapArray {
    static_assert(std::is_trivially_copyable<T>::value);

public:
    T *ptr = nullptr;
    Size len = 0;
    Size capacity = 0;

    typedef T value_type;
    typedef T *iterator_type;

    HeapArray() = default;
    HeapArray(std::initializer_list<T> l)
    {
        Grow((Size)l.size());
        for (const T &value: l) {
            ptr[len++] = value;
        }
    }
    ~HeapArray() { free(ptr); }

    HeapArray(HeapArray &&other) { *this = std::move(other); }
    HeapArray &operator=(HeapArray &&other)
    {
        free(ptr);
        MemCpy((void *)this, &other, LD_SIZE(other));
        MemSet((void *)&other, 0, LD_SIZE(other));
        return *this;
    }
    HeapArray(const HeapArray &other) { *this = other; }
    HeapArray &operator=(const HeapArray &other)
    {
        if (this != &other) {
            Clear();
            Append(other);
        }
        return *this;
    }

    void Clear()
    {
        free(ptr);

        ptr = nullptr;
        len = 0;
        capacity = 0;
    }

    operator Span<T>() { return Span<T>(ptr, len); }
    operator Span<const T>() const { return Span<const T>(ptr, len); }

    T *begin() { return ptr; }
    const T *begin() const { return ptr; }
    T *end() { return ptr + len; }
    const T *end() const { return ptr + len; }

    T &operator[](Size idx)
    {
        LD_ASSERT(idx >= 0 && idx < len);
        return ptr[idx];
    }
    const T &operator[](Size idx) const
    {
        LD_ASSERT(idx >= 0 && idx < len);
        return ptr[idx];
    }

    void Reserve(Size min_capacity)
    {
        if (min_capacity <= capacity)
            return;

        T *new_ptr = (T *)realloc((void *)ptr, (size_t)(min_capacity * LD_SIZE(T)));
        if (!new_ptr) [[unlikely]]
            throw std::bad_alloc();

        ptr = new_ptr;
        capacity = min_capacity;
    }

    void Grow(Size reserve_capacity = 1)
    {
        LD_ASSERT(reserve_capacity >= 0);

        if (reserve_capacity <= capacity - len)
            return;

        Size needed = len + reserve_capacity;
        Size new_capacity = capacity ? capacity : LD_HEAPARRAY_BASE_CAPACITY;

        while (new_capacity < needed) {
            new_capacity = (Size)((double)new_capacity * LD_HEAPARRAY_GROWTH_FACTOR);
        }

        Reserve(new_capacity);
    }

    T *AppendDefault(Size count = 1)
    {
        Grow(count);

        T *first = ptr + len;
        MemSet((void *)first, 0, count * LD_SIZE(T));
        len += count;

        return first;
    }

    T *Append(const T &value)
    {
        Grow();

        T *it = ptr + len;
        *it = value;
        len++;

        return it;
    }
    T *Append(Span<const T> values)
    {
        Grow(values.len);

        T *it = ptr + len;
        MemCpy((void *)it, values.ptr, values.len * LD_SIZE(T));
        len += values.len;

        return it;
    }

    void RemoveFrom(Size first)
    {
        LD_ASSERT(first >= 0 && first <= len);
        len = first;
    }

    Span<T> Take(Size offset, Size sub_len) const
    {
        Span<T> span = Span<T>(ptr, len);
        return span.Take(offset, sub_len);
    }
};

// ------------------------------------------------------------------------
// Strings
// ------------------------------------------------------------------------

static constexpr inline bool IsAsciiWhite(int c)
{
    return c == ' ' || c == '\t' || c == '\v' ||
           c == '\n' || c == '\r' || c == '\f';
}

static constexpr inline char LowerAscii(int c)
{
    if (c >= 'A' && c <= 'Z') {
        return (char)(c + 32);
    } else {
        return (char)c;
    }
}

static inline bool TestStr(Span<const char> str1, Span<const char> str2)
{
    if (str1.len != str2.len)
        return false;
    for (Size i = 0; i < str1.len; i++) {
        if (str1[i] != str2[i])
            return false;
    }

    return true;
}
static inline bool TestStr(Span<const char> str1, const char *str2)
{
    Size i;
    for (i = 0; i < str1.len && str2[i]; i++) {
        if (str1[i] != str2[i])
            return false;
    }

    return (i == str1.len) && !str2[i];
}
static inline bool TestStr(const char *str1, Span<const char> str2)
    { return TestStr(str2, str1); }
static inline bool TestStr(const char *str1, const char *str2)
    { return !strcmp(str1, str2); }

// Case insensitive (ASCII) versions
static inline bool TestStrI(Span<const char> str1, Span<const char> str2)
{
    if (str1.len != str2.len)
        return false;
    for (Size i = 0; i < str1.len; i++) {
        if (LowerAscii(str1[i]) != LowerAscii(str2[i]))
            return false;
    }

    return true;
}

static inline int CmpStr(Span<const char> str1, Span<const char> str2)
{
    for (Size i = 0; i < str1.len && i < str2.len; i++) {
        int delta = str1[i] - str2[i];
        if (delta)
            return delta;
    }

    return (str1.len > str2.len) - (str1.len < str2.len);
}

static inline bool StartsWith(Span<const char> str, Span<const char> prefix)
{
    if (str.len < prefix.len)
        return false;

    return TestStr(str.Take(0, prefix.len), prefix);
}

inline bool Span<const char>::operator==(Span<const char> other) const
    { return TestStr(*this, other); }
inline bool Span<const char>::operator==(const char *other) const
    { return TestStr(*this, other); }

static inline Span<const char> TrimStrLeft(Span<const char> str)
{
    while (str.len && IsAsciiWhite(str[0])) {
        str.ptr++;
        str.len--;
    }

    return str;
}
static inline Span<const char> TrimStrRight(Span<const char> str)
{
    while (str.len && IsAsciiWhite(str[str.len - 1])) {
        str.len--;
    }

    return str;
}
static inline Span<const char> TrimStr(Span<const char> str)
{
    return TrimStrRight(TrimStrLeft(str));
}

Span<const char> SplitStrReverseAny(Span<const char> str, const char *split_chars,
                                    Span<const char> *out_remainder = nullptr);

bool CopyString(const char *str, Span<char> buf);
bool CopyString(Span<const char> str, Span<char> buf);

// ------------------------------------------------------------------------
// Clock
// ------------------------------------------------------------------------

// Milliseconds, never goes backwards
int64_t GetMonotonicTime();

// ------------------------------------------------------------------------
// Format
// ------------------------------------------------------------------------

enum class FmtType {
    Str,
    Char,
    Bool,
    Integer,
    Unsigned,
    Double,
    BigHex,
    SmallHex
};

class FmtArg {
public:
    FmtType type;
    union {
        Span<const char> str;
        char ch;
        bool b;
        int64_t i;
        uint64_t u;
        double d;
    } u;

    int pad = 0;
    char padding = 0;

    FmtArg() = default;
    FmtArg(std::nullptr_t) : type(FmtType::Str) { u.str = "(null)"; }
    FmtArg(const char *str) : type(FmtType::Str) { u.str = str ? str : "(null)"; }
    FmtArg(Span<const char> str) : type(FmtType::Str) { u.str = str; }
    FmtArg(Span<char> str) : type(FmtType::Str) { u.str = str; }
    FmtArg(char c) : type(FmtType::Char) { u.ch = c; }
    FmtArg(bool b) : type(FmtType::Bool) { u.b = b; }
    FmtArg(signed char i) : type(FmtType::Integer) { u.i = i; }
    FmtArg(short i) : type(FmtType::Integer) { u.i = i; }
    FmtArg(int i) : type(FmtType::Integer) { u.i = i; }
    FmtArg(long i) : type(FmtType::Integer) { u.i = i; }
    FmtArg(long long i) : type(FmtType::Integer) { u.i = i; }
    FmtArg(unsigned char u) : type(FmtType::Unsigned) { this->u.u = u; }
    FmtArg(unsigned short u) : type(FmtType::Unsigned) { this->u.u = u; }
    FmtArg(unsigned int u) : type(FmtType::Unsigned) { this->u.u = u; }
    FmtArg(unsigned long u) : type(FmtType::Unsigned) { this->u.u = u; }
    FmtArg(unsigned long long u) : type(FmtType::Unsigned) { this->u.u = u; }
    FmtArg(float f) : type(FmtType::Double) { u.d = (double)f; }
    FmtArg(double d) : type(FmtType::Double) { u.d = d; }
    FmtArg(const void *ptr) : type(FmtType::BigHex) { u.u = (uint64_t)(uintptr_t)ptr; }

    FmtArg &Pad(int len, char c = ' ')
    {
        pad = len;
        padding = c;

        return *this;
    }
    FmtArg &Pad0(int len) { return Pad(len, '0'); }

protected:
    FmtArg(FmtType type) : type(type) {}
};

static inline FmtArg FmtHex(uint64_t u)
{
    FmtArg arg;
    arg.type = FmtType::BigHex;
    arg.u.u = u;
    return arg;
}

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

Span<char> FmtFmt(const char *fmt, Span<const FmtArg> args, bool vt100, Span<char> out_buf);
Span<char> FmtFmt(const char *fmt, Span<const FmtArg> args, bool vt100, HeapArray<char> *out_buf);
void FmtFmt(const char *fmt, Span<const FmtArg> args, bool vt100, FunctionRef<void(Span<const char>)> append);
void PrintFmt(const char *fmt, Span<const FmtArg> args, FILE *fp);
void PrintLnFmt(const char *fmt, Span<const FmtArg> args, FILE *fp);

#define DEFINE_FMT_VARIANT(Ret, Type) \
    static inline Ret Fmt(Type out, const char *fmt) \
    { \
        return FmtFmt(fmt, {}, false, out); \
    } \
    template <typename... Args> \
    Ret Fmt(Type out, const char *fmt, Args... args) \
    { \
        const FmtArg fmt_args[] = { FmtArg(args)... }; \
        return FmtFmt(fmt, fmt_args, false, out); \
    }
#define DEFINE_PRINT_VARIANT(Name, Ret, Type) \
    static inline Ret Name(Type out, const char *fmt) \
    { \
        return Name##Fmt(fmt, {}, out); \
    } \
    template <typename... Args> \
    Ret Name(Type out, const char *fmt, Args... args) \
    { \
        const FmtArg fmt_args[] = { FmtArg(args)... }; \
        return Name##Fmt(fmt, fmt_args, out); \
    }

DEFINE_FMT_VARIANT(Span<char>, Span<char>)
DEFINE_FMT_VARIANT(Span<char>, HeapArray<char> *)
DEFINE_FMT_VARIANT(void, FunctionRef<void(Span<const char>)>)
DEFINE_PRINT_VARIANT(Print, void, FILE *)
DEFINE_PRINT_VARIANT(PrintLn, void, FILE *)

#undef DEFINE_FMT_VARIANT
#undef DEFINE_PRINT_VARIANT

// Print formatted strings to stdout
template <typename... Args>
void Print(const char *fmt, Args... args)
{
    Print(stdout, fmt, args...);
}
template <typename... Args>
void PrintLn(const char *fmt, Args... args)
{
    PrintLn(stdout, fmt, args...);
}

// PrintLn variants without format strings
void PrintLn(FILE *fp);
void PrintLn();

bool FileIsVt100(FILE *fp);

// ------------------------------------------------------------------------
// Debug and errors
// ------------------------------------------------------------------------

typedef void LogFunc(LogLevel level, const char *ctx, const char *msg);
typedef void LogFilterFunc(LogLevel level, const char *ctx, const char *msg,
                           FunctionRef<LogFunc> func);

const char *GetEnv(const char *name);
bool GetDebugFlag(const char *name);

void LogFmt(LogLevel level, const char *ctx, const char *fmt, Span<const FmtArg> args);

static inline void Log(LogLevel level, const char *ctx)
{
    LogFmt(level, ctx, "", {});
}
static inline void Log(LogLevel level, const char *ctx, const char *fmt)
{
    LogFmt(level, ctx, fmt, {});
}
template <typename... Args>
static inline void Log(LogLevel level, const char *ctx, const char *fmt, Args... args)
{
    const FmtArg fmt_args[] = { FmtArg(args)... };
    LogFmt(level, ctx, fmt, fmt_args);
}

// Debug messages are filtered out unless LAMPD_DEBUG is set
template <typename... Args>
static inline void LogDebug(Args... args) { Log(LogLevel::Debug, "Debug: ", args...); }
template <typename... Args>
static inline void LogInfo(Args... args) { Log(LogLevel::Info, nullptr, args...); }
template <typename... Args>
static inline void LogWarning(Args... args) { Log(LogLevel::Warning, "Warning: ", args...); }
template <typename... Args>
static inline void LogError(Args... args) { Log(LogLevel::Error, "Error: ", args...); }

void DefaultLogHandler(LogLevel level, const char *ctx, const char *msg);

void PushLogFilter(const std::function<LogFilterFunc> &func);
void PopLogFilter();

// ------------------------------------------------------------------------
// System
// ------------------------------------------------------------------------

#define LD_PATH_SEPARATORS "/"

enum class FileType {
    Directory,
    File,
    Link,
    Device,
    Pipe,
    Socket
};

bool TestFile(const char *filename, FileType type);
bool TestFile(const char *filename);

Span<const char> GetPathDirectory(Span<const char> filename);
Span<const char> GetPathBaseName(Span<const char> filename);

// Returns the number of bytes read, or -1 on error (logged)
Size ReadFile(const char *filename, Size max_len, HeapArray<char> *out_buf);

void WaitDelay(int64_t delay);

enum class WaitResult {
    Ready,
    Timeout,
    Interrupt,
    Reload,
    Exit
};

struct WaitSource {
    int fd;
    int timeout;
    int events = 0;
};

// After WaitEvents() has been called once (even with timeout 0), SIGINT, SIGTERM and SIGHUP
// don't kill the process anymore. SIGTERM gives WaitResult::Exit, SIGINT gives WaitResult::Interrupt
// and SIGHUP gives WaitResult::Reload (once per signal).
WaitResult WaitEvents(Span<const WaitSource> sources, int64_t timeout, uint64_t *out_ready = nullptr);
WaitResult WaitEvents(int64_t timeout);

void PostReload();

bool NotifySystemd(const char *state = "READY=1");

#define LD_RESTART_EINTR(CallCode, ErrorCond) \
    ([&]() { \
        decltype(CallCode) ret; \
        while ((ret = (CallCode)) ErrorCond && errno == EINTR); \
        return ret; \
    })()

void InitApp();

int Main(int argc, char **argv);

static inline int RunApp(int argc, char **argv)
{
    LD_CRITICAL(argc >= 1, "First argument is missing");

    InitApp();
    return Main(argc, argv);
}

// ------------------------------------------------------------------------
// Parsing
// ------------------------------------------------------------------------

enum class ParseFlag {
    Log = 1 << 0,
    Validate = 1 << 1,
    End = 1 << 2
};
#define LD_DEFAULT_PARSE_FLAGS ((int)ParseFlag::Log | (int)ParseFlag::Validate | (int)ParseFlag::End)

template <typename T>
bool ParseInt(Span<const char> str, T *out_value, unsigned int flags = LD_DEFAULT_PARSE_FLAGS,
              Span<const char> *out_remaining = nullptr)
{
    if (!str.len) [[unlikely]] {
        if (flags & (int)ParseFlag::Log) {
            LogError("Cannot convert empty string to integer");
        }
        return false;
    }

    uint64_t value = 0;

    Size pos = 0;
    uint64_t neg = 0;
    if (str.len >= 2) {
        if (std::numeric_limits<T>::min() < 0 && str[0] == '-') {
            pos = 1;
            neg = UINT64_MAX;
        } else if (str[0] == '+') {
            pos = 1;
        }
    }

    for (; pos < str.len; pos++) {
        unsigned int digit = (unsigned int)(str[pos] - '0');
        if (digit > 9) [[unlikely]] {
            if (!pos || flags & (int)ParseFlag::End) {
                if (flags & (int)ParseFlag::Log) {
                    LogError("Malformed integer number '%1'", str);
                }
                return false;
            } else {
                break;
            }
        }

        uint64_t new_value = (value * 10) + digit;
        if (new_value < value) [[unlikely]]
            goto overflow;
        value = new_value;
    }
    if (value > (uint64_t)std::numeric_limits<T>::max()) [[unlikely]]
        goto overflow;
    value = ((value ^ neg) - neg);

    if (out_remaining) {
        *out_remaining = str.Take(pos, str.len - pos);
    }
    *out_value = (T)value;
    return true;

overflow:
    if (flags & (int)ParseFlag::Log) {
        LogError("Integer overflow for number '%1' (max = %2)", str,
                 std::numeric_limits<T>::max());
    }
    return false;
}

bool ParseBool(Span<const char> str, bool *out_value, unsigned int flags = LD_DEFAULT_PARSE_FLAGS,
               Span<const char> *out_remaining = nullptr);

// ------------------------------------------------------------------------
// Options
// ------------------------------------------------------------------------

struct OptionDesc {
    const char *name;
    const char *help;
};

enum class OptionType {
    NoValue,
    Value
};

class OptionParser {
    LD_DELETE_COPY(OptionParser)

    Span<const char *> args;

    Size pos = 0;
    Size limit;
    Size smallopt_offset = 0;
    char buf[80];

    bool test_failed = false;

public:
    const char *current_option = nullptr;
    const char *current_value = nullptr;

    OptionParser(Span<const char *> args)
        : args(args), limit(args.len) {}
    OptionParser(int argc, char **argv)
        : args((const char **)argv, argc), pos(1), limit(args.len) {}

    const char *Next();

    const char *ConsumeValue();
    const char *ConsumeNonOption();

    bool Test(const char *test1, const char *test2, OptionType type = OptionType::NoValue);
    bool Test(const char *test1, OptionType type = OptionType::NoValue)
        { return Test(test1, nullptr, type); }

    bool TestHasFailed() const { return test_failed; }

    void LogUnknownError() const;
    void LogUnusedArguments() const;
};

template <typename T>
bool OptionToEnumI(Span<const OptionDesc> options, Span<const char> str, T *out_value)
{
    static_assert(std::is_enum<T>::value);

    for (Size i = 0; i < options.len; i++) {
        const OptionDesc &desc = options[i];

        if (TestStrI(desc.name, str)) {
            *out_value = (T)i;
            return true;
        }
    }

    return false;
}

}
