/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * OtpKit public API. Applications only call functions found in this file.
 */

#ifndef OTPKIT_h
#define OTPKIT_h

#include <stdbool.h>
#include <stdint.h>

/** The maximum buffer length for default strings in the system */
#define OTPKIT_MAX_STRING_LENGTH 256

#define OTPKIT_VERSION "1.0.0"

/** Key URI parameter limits and defaults */
#define OTPKIT_MIN_DIGITS 6
#define OTPKIT_MAX_DIGITS 10
#define OTPKIT_DEFAULT_DIGITS 6
#define OTPKIT_MIN_PERIOD 1
#define OTPKIT_MAX_PERIOD 90
#define OTPKIT_DEFAULT_PERIOD 30

#ifdef __cplusplus
extern "C" {
#endif

/**
 * OtpKit Condition Codes
 *
 * All OtpKit functions return this code.
 * OTPKIT_CC_Ok indicates that there was no issue.
 * All other values indication some issue.
 */
typedef enum eOTPKIT_CC
{
    /** The function completed without an error */
    OTPKIT_CC_Ok = 0,
    /** An error occured */
    OTPKIT_CC_Error = 1,
    /** Unexpected NULL pointer */
    OTPKIT_CC_NULLPtr = 2,
    /** Could not open or read a file */
    OTPKIT_CC_FileReadError = 3,
    /** JSON parsing error */
    OTPKIT_CC_JSONError = 4,
    /** An call to an external API failed  */
    OTPKIT_CC_SysError = 5,
    /** Failed to parse input text */
    OTPKIT_CC_ParseError = 6,
    /** The key URI is not a syntactically valid URI */
    OTPKIT_CC_MalformedUri = 7,
    /** The key URI scheme is not "otpauth" */
    OTPKIT_CC_InvalidScheme = 8,
    /** The key URI host is not "totp" */
    OTPKIT_CC_InvalidHost = 9,
    /** The key URI has no secret parameter */
    OTPKIT_CC_MissingSecret = 10,
    /** The secret is empty or is not valid base32 */
    OTPKIT_CC_InvalidSecret = 11,
    /** The algorithm is not SHA1, SHA256, or SHA512 */
    OTPKIT_CC_InvalidAlgorithm = 12,
    /** The digit count is not a number, or is out of range */
    OTPKIT_CC_InvalidDigits = 13,
    /** The period is not a number, or is out of range */
    OTPKIT_CC_InvalidPeriod = 14
} tOTPKIT_CC;

/**
 * OtpKit Error Structure
 *
 * This structure contains the detailed information associated
 * with an error.
 */
typedef struct sOTPKIT_Error
{
    /** The condition code code */
    tOTPKIT_CC code;
    /** String containing a description of the error */
    char szDescription[OTPKIT_MAX_STRING_LENGTH + 1];
    /** String containing the function in which the error occurred */
    char szSourceFunc[OTPKIT_MAX_STRING_LENGTH + 1];
    /** String containing the source file in which the error occurred */
    char szSourceFile[OTPKIT_MAX_STRING_LENGTH + 1];
    /** Line number in the source file in which the error occurred */
    int  nSourceLine;
} tOTPKIT_Error;

/**
 * OtpKit Token Information
 *
 * The display fields of a parsed key URI.
 * The shared secret is deliberately absent.
 */
typedef struct sOTPKIT_TokenInfo
{
    /** account label from the URI path, possibly empty */
    char *szLabel;
    /** issuer name, possibly empty */
    char *szIssuer;
    /** "SHA1", "SHA256", or "SHA512" */
    char *szAlgorithm;
    /** number of digits in each password */
    unsigned int digits;
    /** time step in seconds */
    unsigned int period;
} tOTPKIT_TokenInfo;

/**
 * Sets up debug logging.
 * @param szLogFile a file to receive log output, or NULL for none.
 */
tOTPKIT_CC OTPKIT_Initialize(const char *szLogFile,
                             tOTPKIT_Error *pError);

/**
 * Closes the debug log file, if any.
 */
void OTPKIT_Terminate();

/**
 * Verifies that an otpauth://totp/ key URI is usable.
 * @return The specific validation failure, if any.
 */
tOTPKIT_CC OTPKIT_TokenCheck(const char *szUri,
                             tOTPKIT_Error *pError);

/**
 * Parses a key URI and returns its display fields.
 * @param ppInfo receives the parsed fields.
 * Free with OTPKIT_FreeTokenInfo.
 */
tOTPKIT_CC OTPKIT_TokenInfoGet(const char *szUri,
                               tOTPKIT_TokenInfo **ppInfo,
                               tOTPKIT_Error *pError);

void OTPKIT_FreeTokenInfo(tOTPKIT_TokenInfo *pInfo);

/**
 * Computes the time-based password for a key URI.
 * @param time Unix time, in seconds.
 * @param pszOtp receives the zero-padded password.
 * The caller frees this with OTPKIT_FreeStr.
 */
tOTPKIT_CC OTPKIT_TokenGenerate(const char *szUri,
                                int64_t time,
                                char **pszOtp,
                                tOTPKIT_Error *pError);

void OTPKIT_FreeStr(char *sz);

#ifdef __cplusplus
}
#endif

#endif
