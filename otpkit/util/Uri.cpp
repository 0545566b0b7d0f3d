/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Uri.hpp"

namespace otpkit {

/**
 * RFC 3986 character classes, as bit flags.
 * Locale-dependent <ctype.h> functions are not suitable here.
 */
enum CharClass
{
    charAlpha = 1 << 0,
    charDigit = 1 << 1,
    charScheme = 1 << 2,    // alpha, digit, "+-."
    charPchar = 1 << 3,     // unreserved, sub-delims, ":@"
    charSlash = 1 << 4,     // '/'
    charQuestion = 1 << 5   // '?'
};

static unsigned
charClass(char c)
{
    unsigned out = 0;
    if (('A' <= c && c <= 'Z') || ('a' <= c && c <= 'z'))
        out |= charAlpha | charScheme | charPchar;
    else if ('0' <= c && c <= '9')
        out |= charDigit | charScheme | charPchar;
    else if ('+' == c || '-' == c || '.' == c)
        out |= charScheme | charPchar;
    else if (std::string("_~!$&'()*,;=:@").find(c) != std::string::npos)
        out |= charPchar;
    else if ('/' == c)
        out |= charSlash;
    else if ('?' == c)
        out |= charQuestion;
    return out;
}

/**
 * Returns the value of a hex digit, or -1.
 */
static int
hexValue(char c)
{
    if ('0' <= c && c <= '9')
        return c - '0';
    if ('A' <= c && c <= 'F')
        return c - 'A' + 10;
    if ('a' <= c && c <= 'f')
        return c - 'a' + 10;
    return -1;
}

/**
 * Checks one component of a URI.
 * @param allowed The character classes permitted outside of escapes,
 * or 0 to permit any printable ASCII character.
 */
static bool
componentOk(const std::string &in, unsigned allowed)
{
    for (size_t i = 0; i < in.size(); ++i)
    {
        const char c = in[i];
        if ('%' == c)
        {
            if (in.size() < i + 3 ||
                hexValue(in[i + 1]) < 0 || hexValue(in[i + 2]) < 0)
                return false;
            i += 2;
            continue;
        }

        const auto u = static_cast<unsigned char>(c);
        if (u < 0x20 || 0x7f == u)
            return false;
        if (allowed && !(charClass(c) & allowed))
            return false;
    }
    return true;
}

/**
 * Replaces percent escapes with the bytes they stand for.
 * @param form Also treat '+' as a space, as HTML forms do.
 */
static std::string
percentDecode(const std::string &in, bool form=false)
{
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i)
    {
        if ('%' == in[i] && i + 2 < in.size() &&
            0 <= hexValue(in[i + 1]) && 0 <= hexValue(in[i + 2]))
        {
            out.push_back(static_cast<char>(
                hexValue(in[i + 1]) << 4 | hexValue(in[i + 2])));
            i += 2;
        }
        else
        {
            out.push_back(form && '+' == in[i] ? ' ' : in[i]);
        }
    }
    return out;
}

/**
 * Cuts the text from `pos` up to the first stop character.
 * Advances `pos` to that character, or to the end.
 */
static std::string
take(const std::string &in, size_t &pos, const char *stop)
{
    size_t end = in.find_first_of(stop, pos);
    if (std::string::npos == end)
        end = in.size();
    std::string out = in.substr(pos, end - pos);
    pos = end;
    return out;
}

bool
Uri::decode(const std::string &in, bool strict)
{
    const unsigned authorityChars = strict ? charPchar : 0;
    const unsigned pathChars = strict ? charPchar | charSlash : 0;
    const unsigned queryChars = strict ?
        charPchar | charSlash | charQuestion : 0;
    size_t pos = 0;

    // scheme ":"
    scheme_ = take(in, pos, ":");
    if (scheme_.empty() || !(charClass(scheme_[0]) & charAlpha))
        return false;
    for (char c: scheme_)
        if (!(charClass(c) & charScheme))
            return false;
    if (in.size() == pos)
        return false;
    ++pos;

    // "//" authority
    authorityOk_ = 0 == in.compare(pos, 2, "//");
    authority_.clear();
    if (authorityOk_)
    {
        pos += 2;
        authority_ = take(in, pos, "/?#");
        if (!componentOk(authority_, authorityChars))
            return false;
    }

    path_ = take(in, pos, "?#");
    if (!componentOk(path_, pathChars))
        return false;

    // "?" query
    queryOk_ = pos < in.size() && '?' == in[pos];
    if (queryOk_)
        ++pos;
    query_ = take(in, pos, "#");
    if (!componentOk(query_, queryChars))
        return false;

    // "#" fragment
    fragmentOk_ = pos < in.size();
    if (fragmentOk_)
        ++pos;
    fragment_ = in.substr(pos);
    if (!componentOk(fragment_, queryChars))
        return false;

    return true;
}

std::string
Uri::scheme() const
{
    return scheme_;
}

std::string
Uri::authority() const
{
    return percentDecode(authority_);
}

bool
Uri::authorityOk() const
{
    return authorityOk_;
}

std::string
Uri::authorityRaw() const
{
    return authority_;
}

std::string
Uri::path() const
{
    return percentDecode(path_);
}

std::string
Uri::query() const
{
    return percentDecode(query_);
}

bool
Uri::queryOk() const
{
    return queryOk_;
}

std::string
Uri::fragment() const
{
    return percentDecode(fragment_);
}

bool
Uri::fragmentOk() const
{
    return fragmentOk_;
}

Uri::QueryMap
Uri::queryDecode() const
{
    QueryMap out;

    size_t pos = 0;
    while (pos < query_.size())
    {
        std::string pair = take(query_, pos, "&");
        if (pos < query_.size())
            ++pos;

        const size_t equals = pair.find('=');
        const std::string key = pair.substr(0, equals);
        const std::string value = std::string::npos == equals ?
            std::string() : pair.substr(equals + 1);
        out[percentDecode(key, true)] = percentDecode(value, true);
    }

    return out;
}

} // namespace otpkit
