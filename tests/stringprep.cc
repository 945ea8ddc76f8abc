#include "stringprep.h"
#include "jidexcept.h"
#include "fmt-enum.h"
#include "gtest/gtest.h"

using namespace Jidkit;

TEST(StringprepTest, Nodeprep) {
    EXPECT_EQ(Stringprep::nodeprep("User"), "user");
    EXPECT_EQ(Stringprep::nodeprep("straße"), "strasse");
    EXPECT_THROW(Stringprep::nodeprep("a@b"), normalization_error);
    EXPECT_THROW(Stringprep::nodeprep("a b"), normalization_error);
}

TEST(StringprepTest, Resourceprep) {
    EXPECT_EQ(Stringprep::resourceprep("Home"), "Home");
    EXPECT_EQ(Stringprep::resourceprep("a b/c@d"), "a b/c@d");
    // Fullwidth letters are NFKC-mapped but keep their case.
    EXPECT_EQ(Stringprep::resourceprep("Ｈome"), "Home");
}

TEST(StringprepTest, Nameprep) {
    EXPECT_EQ(Stringprep::nameprep("EXAMPLE.com"), "example.com");
    EXPECT_EQ(Stringprep::nameprep("bücher.example"), "xn--bcher-kva.example");
    EXPECT_THROW(Stringprep::nameprep(""), normalization_error);
}

TEST(StringprepTest, ToAscii) {
    EXPECT_EQ(Stringprep::to_ascii("example.com"), "example.com");
    EXPECT_EQ(Stringprep::to_ascii("éxample.com"), "xn--xample-9ua.com");
}

TEST(StringprepTest, InvalidUtf8) {
    EXPECT_THROW(Stringprep::nodeprep("a\xff"), normalization_error);
    EXPECT_THROW(Stringprep::resourceprep("\xc3"), normalization_error);
}

TEST(StringprepTest, Idempotent) {
    for (auto kind : {PrepKind::NODEPREP, PrepKind::NAMEPREP, PrepKind::RESOURCEPREP}) {
        for (std::string s : {"Example", "BÜCHER", "Ångström", "MiXeD.CaSe"}) {
            auto once = Stringprep::prep(kind, s);
            EXPECT_EQ(Stringprep::prep(kind, once), once) << fmt::format("{} of {}", kind, s);
        }
    }
}

TEST(StringprepTest, KindNames) {
    EXPECT_EQ(fmt::format("{}", PrepKind::NODEPREP), "nodeprep");
    EXPECT_EQ(fmt::format("{}", PrepKind::NAMEPREP), "nameprep");
    EXPECT_EQ(fmt::format("{}", PrepKind::RESOURCEPREP), "resourceprep");
}
