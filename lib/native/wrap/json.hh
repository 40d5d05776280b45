// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#pragma once

#include "lib/native/base/base.hh"
LD_PUSH_NO_WARNINGS
#define RAPIDJSON_NO_SIZETYPEDEFINE
namespace rapidjson { typedef LD::Size SizeType; }
#include <rapidjson/reader.h>
#include <rapidjson/error/en.h>
LD_POP_NO_WARNINGS

namespace LD {

class json_StreamReader {
    LD_DELETE_COPY(json_StreamReader)

    const char *filename;
    Span<const char> buf;
    Size offset = 0;

    int line_number = 1;
    int line_offset = 1;

public:
    typedef char Ch;

    json_StreamReader(Span<const char> buf, const char *filename)
        : filename(filename), buf(buf) {}

    char Peek() const { return offset < buf.len ? buf[offset] : 0; }
    char Take();
    size_t Tell() const { return (size_t)offset; }

    // Not implemented
    void Put(char) {}
    void Flush() {}
    char *PutBegin() { return nullptr; }
    Size PutEnd(char *) { return 0; }

    const char *GetFileName() const { return filename; }
    int GetLineNumber() const { return line_number; }
    int GetLineOffset() const { return line_offset; }
};

enum class json_TokenType {
    Invalid,

    StartObject,
    EndObject,
    StartArray,
    EndArray,

    Null,
    Bool,
    Number,
    String,

    Key
};
static const char *const json_TokenTypeNames[] = {
    "Invalid",

    "Object",
    "End of object",
    "Array",
    "End of array",

    "Null",
    "Boolean",
    "Number",
    "String",

    "Key"
};

class json_Parser {
    LD_DELETE_COPY(json_Parser)

    struct Handler {
        // Strings and keys stay valid for the lifetime of the parser
        HeapArray<char *> strings;

        json_TokenType token = json_TokenType::Invalid;
        union {
            bool b;
            LocalArray<char, 128> num;
            Span<const char> str;
        } u = {};

        ~Handler();

        bool StartObject();
        bool EndObject(Size);
        bool StartArray();
        bool EndArray(Size);

        bool Null();
        bool Bool(bool b);
        bool Double(double) { LD_UNREACHABLE(); }
        bool Int(int) { LD_UNREACHABLE(); }
        bool Int64(int64_t) { LD_UNREACHABLE(); }
        bool Uint(unsigned int) { LD_UNREACHABLE(); }
        bool Uint64(uint64_t) { LD_UNREACHABLE(); }
        bool RawNumber(const char *, Size, bool);
        bool String(const char *str, Size len, bool);

        bool Key(const char *key, Size len, bool);

    private:
        Span<const char> Store(const char *str, Size len);
    };

    json_StreamReader st;
    Handler handler;
    rapidjson::Reader reader;

    int depth = 0;

    bool error = false;
    bool eof = false;

public:
    json_Parser(Span<const char> buf, const char *filename);

    const char *GetFileName() const { return st.GetFileName(); }
    bool IsValid() const { return !error; }
    bool IsEOF() const { return eof; }

    bool ParseKey(Span<const char> *out_key);
    Span<const char> ParseKey();

    bool ParseObject();
    bool InObject();
    bool ParseArray();
    bool InArray();

    bool ParseNull();
    bool ParseBool(bool *out_value);
    bool ParseInt(int64_t *out_value);
    bool ParseInt(int *out_value);
    bool ParseString(Span<const char> *out_str);
    Span<const char> ParseString();

    bool IsNumberFloat() const;

    bool Skip();

    void UnexpectedKey(Span<const char> key);

    void PushLogFilter();

    json_TokenType PeekToken();
    bool ConsumeToken(json_TokenType token);

    // Make sure nothing but whitespace and comments follows the root value
    bool ParseEnd();

private:
    bool IncreaseDepth();
};

}
