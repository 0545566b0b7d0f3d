/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "OtpKit.h"
#include "../otpkit/token/Token.hpp"
#include "../otpkit/util/Debug.hpp"
#include "../otpkit/util/Util.hpp"

using namespace otpkit;

#define OTPKIT_PROLOG() \
    OTPKIT_DebugLog("%s called", __FUNCTION__); \
    tOTPKIT_CC cc = OTPKIT_CC_Ok; \
    OTPKIT_SET_ERR_CODE(pError, OTPKIT_CC_Ok)

#define OTPKIT_GET_TOKEN() \
    std::shared_ptr<Token> token; \
    OTPKIT_CHECK_NEW(Token::create(token, szUri), pError)

tOTPKIT_CC OTPKIT_Initialize(const char *szLogFile,
                             tOTPKIT_Error *pError)
{
    OTPKIT_PROLOG();

    OTPKIT_CHECK_NEW(debugInitialize(szLogFile ? szLogFile : ""), pError);

exit:
    return cc;
}

void OTPKIT_Terminate()
{
    debugTerminate();
}

tOTPKIT_CC OTPKIT_TokenCheck(const char *szUri,
                             tOTPKIT_Error *pError)
{
    OTPKIT_PROLOG();
    OTPKIT_CHECK_NULL(szUri);

    {
        OTPKIT_GET_TOKEN();
    }

exit:
    return cc;
}

tOTPKIT_CC OTPKIT_TokenInfoGet(const char *szUri,
                               tOTPKIT_TokenInfo **ppInfo,
                               tOTPKIT_Error *pError)
{
    OTPKIT_PROLOG();
    OTPKIT_CHECK_NULL(szUri);
    OTPKIT_CHECK_NULL(ppInfo);

    {
        OTPKIT_GET_TOKEN();

        tOTPKIT_TokenInfo *pInfo = structAlloc<tOTPKIT_TokenInfo>();
        pInfo->szLabel = stringCopy(token->label());
        pInfo->szIssuer = stringCopy(token->issuer());
        pInfo->szAlgorithm = stringCopy(token->algorithmName());
        pInfo->digits = token->digits();
        pInfo->period = token->period();
        *ppInfo = pInfo;
    }

exit:
    return cc;
}

void OTPKIT_FreeTokenInfo(tOTPKIT_TokenInfo *pInfo)
{
    // Cannot use OTPKIT_PROLOG - no pError
    OTPKIT_DebugLog("%s called", __FUNCTION__);

    if (pInfo)
    {
        stringFree(pInfo->szLabel);
        stringFree(pInfo->szIssuer);
        stringFree(pInfo->szAlgorithm);
        free(pInfo);
    }
}

tOTPKIT_CC OTPKIT_TokenGenerate(const char *szUri,
                                int64_t time,
                                char **pszOtp,
                                tOTPKIT_Error *pError)
{
    OTPKIT_PROLOG();
    OTPKIT_CHECK_NULL(szUri);
    OTPKIT_CHECK_NULL(pszOtp);

    {
        OTPKIT_GET_TOKEN();

        *pszOtp = stringCopy(token->generate(time));
    }

exit:
    return cc;
}

void OTPKIT_FreeStr(char *sz)
{
    stringFree(sz);
}
