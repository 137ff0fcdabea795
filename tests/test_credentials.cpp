// *****************************************************************************
// * This file is part of the FtpMirror project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FtpMirror authors - All Rights Reserved                 *
// *****************************************************************************

#include <cstdlib>
#include <unistd.h>
#include "test_helpers.h"

using namespace mirr;
using namespace fmr;
using namespace fmr::test;


namespace
{
class FakeCredentialSource : public CredentialSource
{
public:
    Credentials loadCredentials() const override
    {
        ++loadCount;
        if (!available)
            throw ErrorConfigMissing(L"Account file not found.");
        return {"stored.example.com", "storedUser", "storedPass"};
    }

    bool available = true;
    mutable int loadCount = 0;
};
}


TEST(Credentials, ExplicitValuesDoNotTouchFallback)
{
    FakeCredentialSource source;
    source.available = false;

    const Credentials cred = resolveCredentials("server", "user", "pass", source);
    EXPECT_EQ(cred.host,     "server");
    EXPECT_EQ(cred.username, "user");
    EXPECT_EQ(cred.password, "pass");
    EXPECT_EQ(source.loadCount, 0);
}

TEST(Credentials, MissingPasswordTakesAllFieldsFromFallback)
{
    FakeCredentialSource source;

    const Credentials cred = resolveCredentials("server", "user", std::nullopt, source);
    EXPECT_EQ(cred.host,     "stored.example.com");
    EXPECT_EQ(cred.username, "storedUser");
    EXPECT_EQ(cred.password, "storedPass");
    EXPECT_EQ(source.loadCount, 1);
}

TEST(Credentials, EmptyUserCountsAsMissing)
{
    FakeCredentialSource source;

    const Credentials cred = resolveCredentials("server", "", "pass", source);
    EXPECT_EQ(cred.username, "storedUser");
    EXPECT_EQ(source.loadCount, 1);
}

TEST(Credentials, MissingHostIsTakenFromFallback)
{
    FakeCredentialSource source;

    const Credentials cred = resolveCredentials(std::nullopt, "user", "pass", source);
    EXPECT_EQ(cred.host,     "stored.example.com");
    EXPECT_EQ(cred.username, "user");
    EXPECT_EQ(cred.password, "pass");
}

TEST(Credentials, FallbackFailureIsPropagated)
{
    FakeCredentialSource source;
    source.available = false;

    EXPECT_THROW(resolveCredentials(std::nullopt, std::nullopt, std::nullopt, source), ErrorConfigMissing);
}

TEST(Credentials, ParseAccountDocument)
{
    const Credentials cred = parseAccountDocument(R"({"host": " ftp.example.com ", "username": "anna", "password": "päss"})", Zstr("account.json"));
    EXPECT_EQ(cred.host,     "ftp.example.com");
    EXPECT_EQ(cred.username, "anna");
    EXPECT_EQ(cred.password, "p\xc3\xa4ss");
}

TEST(Credentials, ParseAccountDocumentErrors)
{
    EXPECT_THROW(parseAccountDocument(R"({"host": "a", "username": "b"})",                   Zstr("f")), ErrorConfigInvalid); //missing field
    EXPECT_THROW(parseAccountDocument(R"({"host": "a", "username": "b", "password": 123})",  Zstr("f")), ErrorConfigInvalid); //not a string
    EXPECT_THROW(parseAccountDocument(R"({"host": "", "username": "b", "password": "c"})",   Zstr("f")), ErrorConfigInvalid); //empty host
    EXPECT_THROW(parseAccountDocument(R"(["a", "b", "c"])",                                  Zstr("f")), ErrorConfigInvalid); //no object
    EXPECT_THROW(parseAccountDocument("",                                                    Zstr("f")), ErrorConfigInvalid);
}

TEST(Credentials, SyntaxErrorReportsRowAndColumn)
{
    try
    {
        parseAccountDocument("{\n  \"host\": ,\n}", Zstr("account.json"));
        FAIL() << "exception expected";
    }
    catch (const ErrorConfigInvalid& e)
    {
        EXPECT_TRUE(contains(e.toString(), L"row 2, column 11")) << utfTo<std::string>(e.toString());
        EXPECT_TRUE(contains(e.toString(), L"account.json"));
    }
}

TEST(Credentials, DefaultAccountFileNotNeededForExplicitValues)
{
    const AccountFileSource source(std::nullopt);

    const Credentials cred = resolveCredentials("ftp://h", "u", "p", source);
    EXPECT_EQ(cred.host,     "ftp://h");
    EXPECT_EQ(cred.username, "u");
    EXPECT_EQ(cred.password, "p");
}

TEST(Credentials, DefaultAccountFileLocation)
{
    if (::getuid() == 0) //root ignores XDG_CONFIG_HOME
        GTEST_SKIP();

    TempFolder tmp;
    tmp.writeFile(Zstr("FtpMirror/FtpAccount.json"), R"({"host": "h", "username": "u", "password": "p"})");

    const char* oldValue = std::getenv("XDG_CONFIG_HOME");
    const std::optional<std::string> oldXdg = oldValue ? std::optional<std::string>(oldValue) : std::nullopt;
    ASSERT_EQ(::setenv("XDG_CONFIG_HOME", tmp.path().c_str(), 1), 0);
    MIRR_ON_SCOPE_EXIT(if (oldXdg) ::setenv("XDG_CONFIG_HOME", oldXdg->c_str(), 1); else ::unsetenv("XDG_CONFIG_HOME"));

    const AccountFileSource source(std::nullopt); //path is looked up here, not at construction
    EXPECT_EQ(source.loadCredentials().username, "u");
}

TEST(Credentials, AccountFileMissing)
{
    TempFolder tmp;
    const AccountFileSource source(appendPath(tmp.path(), Zstr("FtpAccount.json")));

    EXPECT_THROW(source.loadCredentials(), ErrorConfigMissing);
}

TEST(Credentials, AccountFileIsRead)
{
    TempFolder tmp;
    const Zstring filePath = tmp.writeFile(Zstr("FtpAccount.json"), R"({"host": "ftp://h:2121", "username": "u", "password": "p"})");

    const Credentials cred = AccountFileSource(filePath).loadCredentials();
    EXPECT_EQ(cred.host,     "ftp://h:2121");
    EXPECT_EQ(cred.username, "u");
    EXPECT_EQ(cred.password, "p");
}

TEST(Credentials, AccountFileCorrupted)
{
    TempFolder tmp;
    const Zstring filePath = tmp.writeFile(Zstr("FtpAccount.json"), "{\"host\": \"h\"");

    EXPECT_THROW(AccountFileSource(filePath).loadCredentials(), ErrorConfigInvalid);
}

TEST(Credentials, AccountFileIsFolder)
{
    TempFolder tmp;
    const Zstring folderPath = tmp.makeFolder(Zstr("FtpAccount.json"));

    EXPECT_THROW(AccountFileSource(folderPath).loadCredentials(), ErrorConfigInvalid);
}
