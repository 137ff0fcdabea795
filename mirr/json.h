// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef JSON_H_8374650192837465
#define JSON_H_8374650192837465

#include <algorithm>
#include <map>
#include <optional>
#include <vector>
#include "string_tools.h"
#include "utf.h"


namespace mirr
{
//RFC 8259 reader: numbers are kept as their source text
struct JsonValue
{
    enum class Type
    {
        null,    //
        boolean, //primitive types
        number,  //
        string,  //
        array,
        object,
    };

    /**/     JsonValue() {}
    explicit JsonValue(Type t)          : type(t) {}
    explicit JsonValue(std::string str) : type(Type::string), primVal(std::move(str)) {}

    Type type = Type::null;
    std::string                      primVal; //for primitive types
    std::vector<JsonValue>           arrayVal;
    std::map<std::string, JsonValue> objectVal; //duplicate keys: first one wins
};


struct JsonParsingError
{
    JsonParsingError(size_t rowNo, size_t colNo) : row(rowNo), col(colNo) {}
    const size_t row; //beginning with 0
    const size_t col; //
};
JsonValue parseJson(const std::string& stream); //throw JsonParsingError


inline
const JsonValue* getChildFromJsonObject(const JsonValue& jvalue, const std::string& name)
{
    if (jvalue.type != JsonValue::Type::object)
        return nullptr;

    auto it = jvalue.objectVal.find(name);
    if (it == jvalue.objectVal.end())
        return nullptr;

    return &it->second;
}


//string values only: numbers, booleans and null are rejected
inline
std::optional<std::string> getStringFromJsonObject(const JsonValue& jvalue, const std::string& name)
{
    if (const JsonValue* childValue = getChildFromJsonObject(jvalue, name))
        if (childValue->type == JsonValue::Type::string)
            return childValue->primVal;
    return std::nullopt;
}








//---------------------- implementation ----------------------
namespace json_impl
{
class JsonParser
{
public:
    explicit JsonParser(const std::string& stream) : stream_(stream)
    {
        if (startsWith(stream_, "\xef\xbb\xbf")) //UTF-8 byte order mark
            pos_ = 3;
    }

    JsonValue parse() //throw JsonParsingError
    {
        JsonValue jval = parseValue(); //throw JsonParsingError
        skipWhiteSpace();
        if (pos_ != stream_.size())
            throw error();
        return jval;
    }

private:
    JsonParser           (const JsonParser&) = delete;
    JsonParser& operator=(const JsonParser&) = delete;

    JsonValue parseValue() //throw JsonParsingError
    {
        skipWhiteSpace();
        if (pos_ == stream_.size())
            throw error();

        switch (stream_[pos_])
        {
            case '{':
                return parseObject(); //throw JsonParsingError
            case '[':
                return parseArray(); //throw JsonParsingError
            case '"':
                return JsonValue(parseString()); //throw JsonParsingError
        }

        if (consumeKeyword("null"))
            return JsonValue();

        for (const char* kw : {"true", "false"})
            if (consumeKeyword(kw))
            {
                JsonValue jval(JsonValue::Type::boolean);
                jval.primVal = kw;
                return jval;
            }

        const size_t numEnd = [&]
        {
            size_t i = pos_;
            while (i < stream_.size() && isNumberChar(stream_[i]))
                ++i;
            return i;
        }();
        if (numEnd == pos_ || !isDigit(stream_[numEnd - 1]))
            throw error();

        JsonValue jval(JsonValue::Type::number);
        jval.primVal = stream_.substr(pos_, numEnd - pos_);
        pos_ = numEnd;
        return jval;
    }

    JsonValue parseObject() //throw JsonParsingError
    {
        ++pos_; //'{'
        JsonValue jval(JsonValue::Type::object);

        skipWhiteSpace();
        if (consumeChar('}'))
            return jval;

        for (;;)
        {
            skipWhiteSpace();
            if (pos_ == stream_.size() || stream_[pos_] != '"')
                throw error();
            std::string name = parseString(); //throw JsonParsingError

            skipWhiteSpace();
            if (!consumeChar(':'))
                throw error();

            JsonValue value = parseValue(); //throw JsonParsingError
            jval.objectVal.emplace(std::move(name), std::move(value));

            skipWhiteSpace();
            if (consumeChar('}'))
                return jval;
            if (!consumeChar(','))
                throw error();
        }
    }

    JsonValue parseArray() //throw JsonParsingError
    {
        ++pos_; //'['
        JsonValue jval(JsonValue::Type::array);

        skipWhiteSpace();
        if (consumeChar(']'))
            return jval;

        for (;;)
        {
            jval.arrayVal.push_back(parseValue()); //throw JsonParsingError

            skipWhiteSpace();
            if (consumeChar(']'))
                return jval;
            if (!consumeChar(','))
                throw error();
        }
    }

    std::string parseString() //throw JsonParsingError
    {
        ++pos_; //'"'
        std::string output;
        char32_t highSurrogate = 0;

        while (pos_ < stream_.size())
        {
            const char c = stream_[pos_];
            if (c == '"')
            {
                ++pos_;
                if (highSurrogate != 0)
                    impl::codePointToUtf8(REPLACEMENT_CHAR, output);
                return output;
            }
            if (static_cast<unsigned char>(c) < 32) //control characters must be escaped
                throw error();

            if (c != '\\')
            {
                if (highSurrogate != 0)
                {
                    impl::codePointToUtf8(REPLACEMENT_CHAR, output);
                    highSurrogate = 0;
                }
                output += c;
                ++pos_;
                continue;
            }

            if (++pos_ == stream_.size())
                break;
            const char c2 = stream_[pos_++];

            if (c2 == 'u')
            {
                if (stream_.size() - pos_ < 4)
                    throw error();

                char32_t unit = 0;
                for (size_t i = 0; i < 4; ++i)
                {
                    const char h = stream_[pos_ + i];
                    const int nibble = isDigit(h) ? h - '0' :
                                       'a' <= h && h <= 'f' ? h - 'a' + 10 :
                                       'A' <= h && h <= 'F' ? h - 'A' + 10 : -1;
                    if (nibble < 0)
                        throw error();
                    unit = unit * 16 + static_cast<char32_t>(nibble);
                }
                pos_ += 4;

                if (0xd800 <= unit && unit < 0xdc00)
                {
                    if (highSurrogate != 0)
                        impl::codePointToUtf8(REPLACEMENT_CHAR, output);
                    highSurrogate = unit;
                }
                else if (0xdc00 <= unit && unit < 0xe000 && highSurrogate != 0)
                {
                    impl::codePointToUtf8(0x10000 + ((highSurrogate - 0xd800) << 10) + (unit - 0xdc00), output);
                    highSurrogate = 0;
                }
                else
                {
                    if (highSurrogate != 0)
                        impl::codePointToUtf8(REPLACEMENT_CHAR, output);
                    highSurrogate = 0;
                    impl::codePointToUtf8(unit, output);
                }
                continue;
            }

            if (highSurrogate != 0)
            {
                impl::codePointToUtf8(REPLACEMENT_CHAR, output);
                highSurrogate = 0;
            }

            switch (c2)
            {
                //*INDENT-OFF*
                case '\\':
                case '"':
                case '/': output += c2;   break;
                case 'b': output += '\b'; break;
                case 'f': output += '\f'; break;
                case 'n': output += '\n'; break;
                case 'r': output += '\r'; break;
                case 't': output += '\t'; break;
                default:
                    --pos_;
                    throw error(); //unknown escape sequence
                //*INDENT-ON*
            }
        }
        throw error(); //unexpected end of stream
    }

    void skipWhiteSpace()
    {
        while (pos_ < stream_.size() && (stream_[pos_] == ' ' || stream_[pos_] == '\t' || stream_[pos_] == '\r' || stream_[pos_] == '\n'))
            ++pos_;
    }

    bool consumeChar(char c)
    {
        if (pos_ < stream_.size() && stream_[pos_] == c)
        {
            ++pos_;
            return true;
        }
        return false;
    }

    bool consumeKeyword(const std::string& kw)
    {
        if (stream_.compare(pos_, kw.size(), kw) != 0)
            return false;
        pos_ += kw.size();
        return true;
    }

    static bool isNumberChar(char c) { return isDigit(c) || c == '-' || c == '+' || c == '.' || c == 'e' || c == 'E'; }

    JsonParsingError error() const
    {
        size_t row = 0;
        size_t lineStart = 0;
        for (size_t i = 0; i < pos_ && i < stream_.size(); ++i)
            if (stream_[i] == '\n')
            {
                ++row;
                lineStart = i + 1;
            }
        return JsonParsingError(row, std::min(pos_, stream_.size()) - lineStart);
    }

    const std::string& stream_;
    size_t pos_ = 0;
};
}


inline
JsonValue parseJson(const std::string& stream) //throw JsonParsingError
{
    return json_impl::JsonParser(stream).parse(); //throw JsonParsingError
}
}

#endif //JSON_H_8374650192837465
