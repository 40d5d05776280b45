// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "lib/native/base/base.hh"
#include "json.hh"

namespace LD {

// Config files are written by hand, accept comments in them
static const unsigned int ParseFlags = rapidjson::kParseNumbersAsStringsFlag |
                                       rapidjson::kParseStopWhenDoneFlag |
                                       rapidjson::kParseCommentsFlag;

char json_StreamReader::Take()
{
    if (offset >= buf.len)
        return 0;

    char c = buf[offset++];
    if (c == '\n') {
        line_number++;
        line_offset = 1;
    } else {
        line_offset++;
    }
    return c;
}

json_Parser::Handler::~Handler()
{
    for (char *str: strings) {
        free(str);
    }
}

Span<const char> json_Parser::Handler::Store(const char *str, Size len)
{
    char *copy = (char *)malloc((size_t)len + 1);
    if (!copy) [[unlikely]]
        throw std::bad_alloc();

    MemCpy(copy, str, len);
    copy[len] = 0;
    strings.Append(copy);

    return MakeSpan((const char *)copy, len);
}

bool json_Parser::Handler::StartObject()
{
    token = json_TokenType::StartObject;
    return true;
}

bool json_Parser::Handler::EndObject(Size)
{
    token = json_TokenType::EndObject;
    return true;
}

bool json_Parser::Handler::StartArray()
{
    token = json_TokenType::StartArray;
    return true;
}

bool json_Parser::Handler::EndArray(Size)
{
    token = json_TokenType::EndArray;
    return true;
}

bool json_Parser::Handler::Null()
{
    token = json_TokenType::Null;
    return true;
}

bool json_Parser::Handler::Bool(bool b)
{
    token = json_TokenType::Bool;
    u.b = b;
    return true;
}

bool json_Parser::Handler::RawNumber(const char *str, Size len, bool)
{
    token = json_TokenType::Number;

    u.num.len = std::min(len, LD_SIZE(u.num.data) - 1);
    MemCpy(u.num.data, str, u.num.len);
    u.num.data[u.num.len] = 0;

    return true;
}

bool json_Parser::Handler::String(const char *str, Size len, bool)
{
    token = json_TokenType::String;
    u.str = Store(str, len);
    return true;
}

bool json_Parser::Handler::Key(const char *key, Size len, bool)
{
    token = json_TokenType::Key;
    u.str = Store(key, len);
    return true;
}

json_Parser::json_Parser(Span<const char> buf, const char *filename)
    : st(buf, filename)
{
    reader.IterativeParseInit();
}

bool json_Parser::ParseKey(Span<const char> *out_key)
{
    if (ConsumeToken(json_TokenType::Key)) {
        *out_key = handler.u.str;
        return true;
    } else {
        return false;
    }
}

Span<const char> json_Parser::ParseKey()
{
    if (ConsumeToken(json_TokenType::Key)) {
        return handler.u.str;
    } else {
        return {};
    }
}

bool json_Parser::ParseObject()
{
    return ConsumeToken(json_TokenType::StartObject) &&
           IncreaseDepth();
}

bool json_Parser::InObject()
{
    if (PeekToken() == json_TokenType::EndObject) {
        depth--;
        handler.token = json_TokenType::Invalid;
    }

    return handler.token != json_TokenType::Invalid;
}

bool json_Parser::ParseArray()
{
    return ConsumeToken(json_TokenType::StartArray) &&
           IncreaseDepth();
}

bool json_Parser::InArray()
{
    if (PeekToken() == json_TokenType::EndArray) {
        depth--;
        handler.token = json_TokenType::Invalid;
    }

    return handler.token != json_TokenType::Invalid;
}

bool json_Parser::ParseNull()
{
    return ConsumeToken(json_TokenType::Null);
}

bool json_Parser::ParseBool(bool *out_b)
{
    if (ConsumeToken(json_TokenType::Bool)) {
        *out_b = handler.u.b;
        return true;
    } else {
        return false;
    }
}

bool json_Parser::ParseInt(int64_t *out_i)
{
    if (ConsumeToken(json_TokenType::Number)) {
        error |= !LD::ParseInt(handler.u.num, out_i);
        return !error;
    } else {
        return false;
    }
}

bool json_Parser::ParseInt(int *out_i)
{
    if (ConsumeToken(json_TokenType::Number)) {
        error |= !LD::ParseInt(handler.u.num, out_i);
        return !error;
    } else {
        return false;
    }
}

bool json_Parser::ParseString(Span<const char> *out_str)
{
    if (ConsumeToken(json_TokenType::String)) {
        *out_str = handler.u.str;
        return true;
    } else {
        return false;
    }
}

Span<const char> json_Parser::ParseString()
{
    if (ConsumeToken(json_TokenType::String)) {
        return handler.u.str;
    } else {
        return {};
    }
}

bool json_Parser::IsNumberFloat() const
{
    if (handler.token != json_TokenType::Number)
        return false;

    return strchr(handler.u.num.data, '.') || strchr(handler.u.num.data, 'e') ||
                                              strchr(handler.u.num.data, 'E');
}

bool json_Parser::Skip()
{
    switch (PeekToken()) {
        case json_TokenType::Invalid: return false;

        case json_TokenType::StartObject: {
            for (ParseObject(); InObject(); ) {
                Skip();
            }
        } break;
        case json_TokenType::EndObject: { LD_ASSERT(error); } break;
        case json_TokenType::StartArray: {
            for (ParseArray(); InArray(); ) {
                Skip();
            }
        } break;
        case json_TokenType::EndArray: { LD_ASSERT(error); } break;

        case json_TokenType::Null:
        case json_TokenType::Bool:
        case json_TokenType::Number:
        case json_TokenType::String: { handler.token = json_TokenType::Invalid; } break;

        case json_TokenType::Key: {
            handler.token = json_TokenType::Invalid;
            Skip();
        } break;
    }

    return IsValid();
}

void json_Parser::UnexpectedKey(Span<const char> key)
{
    if (!IsValid())
        return;

    LogError("Unexpected key '%1'", key);
    error = true;
}

void json_Parser::PushLogFilter()
{
    LD::PushLogFilter([this](LogLevel level, const char *, const char *msg, FunctionRef<LogFunc> func) {
        char ctx[1024];
        Fmt(ctx, "%1(%2:%3): ", st.GetFileName(), st.GetLineNumber(), st.GetLineOffset());

        func(level, ctx, msg);
    });
}

json_TokenType json_Parser::PeekToken()
{
    if (error) [[unlikely]]
        return json_TokenType::Invalid;

    if (handler.token == json_TokenType::Invalid) {
        if (!reader.IterativeParseNext<ParseFlags>(st, handler)) {
            if (reader.HasParseError()) {
                if (!error) {
                    rapidjson::ParseErrorCode err = reader.GetParseErrorCode();
                    LogError("%1", GetParseError_En(err));
                }
                error = true;
            } else {
                eof = true;
            }
        }
    }

    return handler.token;
}

bool json_Parser::ConsumeToken(json_TokenType token)
{
    if (PeekToken() != token && !error) {
        if (eof) {
            LogError("Unexpected end of JSON file");
        } else {
            LogError("Unexpected token '%1', expected '%2'",
                     json_TokenTypeNames[(int)handler.token], json_TokenTypeNames[(int)token]);
        }
        error = true;
    }

    handler.token = json_TokenType::Invalid;
    return !error;
}

bool json_Parser::ParseEnd()
{
    if (error) [[unlikely]]
        return false;

    // StopWhenDone leaves anything after the root value unread
    for (;;) {
        char c = st.Peek();

        if (IsAsciiWhite(c)) {
            st.Take();
        } else if (c == '/') {
            st.Take();

            if (st.Peek() == '/') {
                while (st.Peek() && st.Peek() != '\n') {
                    st.Take();
                }
            } else if (st.Peek() == '*') {
                st.Take();

                for (;;) {
                    char c2 = st.Take();

                    if (!c2) {
                        LogError("Unterminated comment at end of JSON file");
                        error = true;
                        return false;
                    }
                    if (c2 == '*' && st.Peek() == '/') {
                        st.Take();
                        break;
                    }
                }
            } else {
                LogError("Unexpected content after JSON value");
                error = true;
                return false;
            }
        } else if (c) {
            LogError("Unexpected content after JSON value");
            error = true;
            return false;
        } else {
            break;
        }
    }

    eof = true;
    return true;
}

bool json_Parser::IncreaseDepth()
{
    if (depth >= 16) [[unlikely]] {
        LogError("Excessive depth for JSON object or array");
        error = true;
        return false;
    }

    depth++;
    return true;
}

}
