/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OTPKIT_UTIL_URI_HPP
#define OTPKIT_UTIL_URI_HPP

#include <map>
#include <string>

namespace otpkit {

/**
 * A parsed URI according to RFC 3986.
 */
class Uri
{
public:
    /**
     * Decodes a URI from a string.
     * @param strict Set to false to tolerate unescaped special characters.
     * Percent escapes must be well-formed and control characters are
     * rejected either way.
     */
    bool decode(const std::string &in, bool strict=true);

    /**
     * Returns the URI scheme exactly as written.
     */
    std::string scheme() const;

    /**
     * Obtains the unescaped authority part, if any (user@server:port).
     */
    std::string authority() const;
    bool authorityOk() const;

    /**
     * Returns the authority part exactly as written, escapes included.
     */
    std::string authorityRaw() const;

    /**
     * Obtains the unescaped path part.
     */
    std::string path() const;

    /**
     * Returns the unescaped query string, if any.
     */
    std::string query() const;
    bool queryOk() const;

    /**
     * Returns the unescaped fragment string, if any.
     */
    std::string fragment() const;
    bool fragmentOk() const;

    typedef std::map<std::string, std::string> QueryMap;

    /**
     * Interprets the query string as a sequence of key-value pairs.
     * All query strings are valid, so this function cannot fail.
     * The results are unescaped, with '+' standing for a space.
     * Both keys and values can be zero-length,
     * and if the same key is appears multiple times, the final one wins.
     */
    QueryMap queryDecode() const;

private:
    // All parts are stored with their original escaping:
    std::string scheme_;
    std::string authority_;
    std::string path_;
    std::string query_;
    std::string fragment_;

    bool authorityOk_ = false;
    bool queryOk_ = false;
    bool fragmentOk_ = false;
};

} // namespace otpkit

#endif
