#include "jid.h"
#include "jidexcept.h"
#include "gtest/gtest.h"
#include <algorithm>
#include <exception>
#include <set>
#include <sstream>
#include <unordered_set>
#include <vector>

using namespace Jidkit;

namespace {
    // Rethrows whatever illegal_address wraps and reports whether it was an E.
    template<typename E>
    bool caused_by(illegal_address const &e) {
        try {
            std::rethrow_if_nested(e);
        } catch (E const &) {
            return true;
        } catch (std::exception const &) {
            return false;
        }
        return false;
    }
}

TEST(JidTest, Tests) {
    Jid one("dwd", "dave.cridland.net");
    ASSERT_EQ(one.str(), "dwd@dave.cridland.net");
    ASSERT_EQ(one.bare(), "dwd@dave.cridland.net");
    Jid two("dwd", "dave.cridland.net", "Resource");
    ASSERT_EQ(two.bare(), "dwd@dave.cridland.net");
    ASSERT_EQ(two.full(), "dwd@dave.cridland.net/Resource");
    Jid three("dwd@DAVE.CRIDLAND.NET/Resource");
    ASSERT_EQ(three.domain(), "dave.cridland.net");
    ASSERT_EQ(three.bare(), "dwd@dave.cridland.net");
    ASSERT_EQ(three.full().length(), std::string("dwd@dave.cridland.net/Resource").length());
    ASSERT_EQ(three.full(), "dwd@dave.cridland.net/Resource");
}

TEST(JidTest, BareAddress) {
    Jid jid("user@example.com");
    ASSERT_EQ(jid.local(), "user");
    ASSERT_EQ(jid.domain(), "example.com");
    ASSERT_FALSE(jid.resource_part());
    EXPECT_EQ(jid.bare(), "user@example.com");
    EXPECT_EQ(jid.str(), "user@example.com");
}

TEST(JidTest, FullFormNeedsResource) {
    Jid jid("user@example.com");
    EXPECT_THROW(jid.full(), no_resource);
    EXPECT_THROW(jid.resource(), no_resource);
}

TEST(JidTest, DomainOnly) {
    Jid jid("Example.COM");
    EXPECT_FALSE(jid.local_part());
    EXPECT_FALSE(jid.resource_part());
    EXPECT_EQ(jid.domain(), "example.com");
    EXPECT_EQ(jid.bare(), "example.com");
}

TEST(JidTest, DomainAndResource) {
    Jid jid("example.com/Resource@Home");
    EXPECT_FALSE(jid.local_part());
    EXPECT_EQ(jid.domain(), "example.com");
    EXPECT_EQ(jid.resource(), "Resource@Home");
}

TEST(JidTest, CaseFolding) {
    EXPECT_EQ(Jid("User@EXAMPLE.com/Home"), Jid("user@example.com/Home"));
    EXPECT_NE(Jid("User@EXAMPLE.com/Home"), Jid("user@example.com/home"));
    EXPECT_TRUE(Jid::equivalent("User@EXAMPLE.com/Home", "user@example.com/Home"));
    EXPECT_FALSE(Jid::equivalent("user@example.com/Home", "user@example.com/home"));
}

TEST(JidTest, InternationalDomain) {
    Jid jid("user@bücher.example");
    EXPECT_EQ(jid.domain(), "xn--bcher-kva.example");
    EXPECT_EQ(Jid("user@BÜCHER.example"), jid);
}

TEST(JidTest, NodeprepFoldsUnicode) {
    Jid jid("Ñandú@example.com");
    EXPECT_EQ(jid.local(), "ñandú");
}

TEST(JidTest, EmptyDomain) {
    try {
        Jid jid("example.com@");
        FAIL() << "Parsed " << jid;
    } catch (illegal_address &e) {
        EXPECT_TRUE(caused_by<invalid_address>(e));
        EXPECT_EQ(std::string(e.what()), "Illegal JID: example.com@");
    }
    EXPECT_THROW(Jid::parts("example.com@"), invalid_address);
}

TEST(JidTest, EmptyDomainBeforeResource) {
    try {
        Jid jid("user@/resource");
        FAIL() << "Parsed " << jid;
    } catch (illegal_address &e) {
        EXPECT_TRUE(caused_by<normalization_error>(e));
    }
}

TEST(JidTest, ProhibitedNodeCharacter) {
    try {
        Jid jid("us<er@example.com");
        FAIL() << "Parsed " << jid;
    } catch (illegal_address &e) {
        EXPECT_TRUE(caused_by<normalization_error>(e));
        EXPECT_STREQ(e.condition(), "jid-malformed");
    }
}

TEST(JidTest, ComponentTooLong) {
    std::string node(1024, 'a');
    try {
        Jid jid(node, "example.com");
        FAIL() << "Built " << jid;
    } catch (illegal_address &e) {
        EXPECT_TRUE(caused_by<length_exceeded>(e));
    }
    std::string resource(1023, 'r');
    Jid jid("user", "example.com", resource);
    EXPECT_EQ(jid.resource().size(), 1023u);
}

TEST(JidTest, LongDomain) {
    std::string domain;
    for (int i = 0; i != 60; ++i) domain += "abcdefgh.";
    domain += "com";
    Jid jid("user", domain);
    EXPECT_EQ(jid.domain().size(), 543u);
    EXPECT_EQ(jid.domain(), domain);

    std::string too_long;
    for (int i = 0; i != 120; ++i) too_long += "abcdefgh.";
    too_long += "com";
    try {
        Jid bad("user", too_long);
        FAIL() << "Built " << bad;
    } catch (illegal_address &e) {
        EXPECT_TRUE(caused_by<length_exceeded>(e));
    }
}

TEST(JidTest, HyphenatedLabels) {
    EXPECT_EQ(Jid("-example.com").domain(), "-example.com");
    EXPECT_EQ(Jid("example-.com").domain(), "example-.com");
    EXPECT_EQ(Jid("ab--cd.com").domain(), "ab--cd.com");
    // A label over 63 bytes is still refused.
    EXPECT_THROW(Jid(std::string(64, 'a') + ".com"), illegal_address);
}

TEST(JidTest, MultiByteLength) {
    // 512 two-byte characters are 1024 bytes of UTF-8.
    std::string resource;
    for (int i = 0; i != 512; ++i) resource += "é";
    EXPECT_THROW(Jid("user", "example.com", resource), illegal_address);
    resource.resize(resource.size() - 2);
    EXPECT_NO_THROW(Jid("user", "example.com", resource));
}

TEST(JidTest, EmptyComponentsAreAbsent) {
    Jid jid(std::string(), "example.com", std::string());
    EXPECT_FALSE(jid.local_part());
    EXPECT_FALSE(jid.resource_part());
    EXPECT_EQ(jid, Jid("example.com"));
}

TEST(JidTest, TrailingSlashHasNoResource) {
    Jid jid("user@example.com/");
    EXPECT_FALSE(jid.resource_part());
    EXPECT_EQ(jid, Jid("user@example.com"));
    auto p = Jid::parts("a/");
    EXPECT_EQ(p.domain, "a");
    EXPECT_FALSE(p.resource);
}

TEST(JidTest, LeadingAtHasNoNode) {
    auto p = Jid::parts("@example.com");
    EXPECT_FALSE(p.local);
    EXPECT_EQ(p.domain, "example.com");
}

TEST(JidTest, PartsOfNull) {
    auto p = Jid::parts(nullptr);
    EXPECT_FALSE(p.local);
    EXPECT_TRUE(p.domain.empty());
    EXPECT_FALSE(p.resource);
}

TEST(JidTest, PartsRoundTrip) {
    Jid jid("user", "example.com", "phone");
    auto p = Jid::parts(jid.bare());
    EXPECT_EQ(p.local, jid.local_part());
    EXPECT_EQ(p.domain, jid.domain());
    EXPECT_FALSE(p.resource);
    auto q = Jid::parts(jid.full());
    EXPECT_EQ(q.resource, jid.resource_part());
    EXPECT_EQ(Jid(jid.full()), jid);
}

TEST(JidTest, SkipPrep) {
    Jid jid("User", "EXAMPLE.com", "Home", skip_prep);
    EXPECT_EQ(jid.local(), "User");
    EXPECT_EQ(jid.domain(), "EXAMPLE.com");
    EXPECT_EQ(jid.full(), "User@EXAMPLE.com/Home");
    EXPECT_NE(jid, Jid("User@EXAMPLE.com/Home"));
    Jid text("User@EXAMPLE.com/Home", skip_prep);
    EXPECT_EQ(text, jid);
    std::string node(2000, 'x');
    EXPECT_NO_THROW(Jid(node, "example.com", std::nullopt, skip_prep));
}

TEST(JidTest, DerivedJids) {
    Jid jid("user@example.com/Home");
    EXPECT_EQ(jid.bare_jid(), Jid("user@example.com"));
    EXPECT_EQ(jid.domain_jid(), Jid("example.com"));
    EXPECT_THROW(jid.bare_jid().full(), no_resource);
}

TEST(JidTest, EqualityRelation) {
    Jid a("user@example.com/x");
    Jid b("USER@example.com/x");
    Jid c("user@EXAMPLE.COM/x");
    EXPECT_EQ(a, a);
    EXPECT_EQ(a, b);
    EXPECT_EQ(b, a);
    EXPECT_EQ(b, c);
    EXPECT_EQ(a, c);
    EXPECT_NE(Jid("user@example.com"), Jid("user@example.com/x"));
    EXPECT_NE(Jid("example.com"), Jid("user@example.com"));
}

TEST(JidTest, Ordering) {
    std::vector<Jid> jids{Jid("b@example.org"), Jid("example.com"), Jid("a@example.com/z"), Jid("a@example.com"),
                          Jid("b@example.com")};
    std::sort(jids.begin(), jids.end());
    std::vector<std::string> expected{"example.com", "a@example.com", "a@example.com/z", "b@example.com",
                                      "b@example.org"};
    ASSERT_EQ(jids.size(), expected.size());
    for (std::size_t i = 0; i != jids.size(); ++i) {
        EXPECT_EQ(jids[i].str(), expected[i]);
    }
    EXPECT_EQ(Jid("A@Example.com").compare(Jid("a@example.com")), 0);
    EXPECT_TRUE(Jid("a@example.com") < Jid("b@example.com"));
    EXPECT_TRUE(Jid("z@a.example") < Jid("a@b.example"));
}

TEST(JidTest, Containers) {
    std::set<Jid> ordered{Jid("user@example.com"), Jid("USER@example.com"), Jid("user@example.com/r")};
    EXPECT_EQ(ordered.size(), 2u);
    std::unordered_set<Jid> hashed{Jid("user@example.com"), Jid("USER@EXAMPLE.COM"), Jid("user@example.com/r")};
    EXPECT_EQ(hashed.size(), 2u);
    EXPECT_EQ(std::hash<Jid>{}(Jid("User@Example.com")), std::hash<Jid>{}(Jid("user@example.com")));
}

TEST(JidTest, Formatting) {
    Jid jid("user@example.com/Home");
    EXPECT_EQ(fmt::format("<{}>", jid), "<user@example.com/Home>");
    std::ostringstream ss;
    ss << Jid("user@example.com");
    EXPECT_EQ(ss.str(), "user@example.com");
}

TEST(JidTest, ExplicitNormalizer) {
    Normalizer normalizer(4, 4, 4);
    Jid jid("User@Example.com/Home", normalizer);
    EXPECT_EQ(jid.str(), "user@example.com/Home");
    EXPECT_TRUE(normalizer.cache(PrepKind::NODEPREP).contains("user"));
    EXPECT_TRUE(normalizer.cache(PrepKind::NAMEPREP).contains("example.com"));
    EXPECT_TRUE(normalizer.cache(PrepKind::RESOURCEPREP).contains("Home"));
    EXPECT_TRUE(Jid::equivalent("user@example.com", "USER@EXAMPLE.COM", normalizer));
    EXPECT_THROW(Jid::equivalent("user@example.com", "example.com@", normalizer), illegal_address);
}
