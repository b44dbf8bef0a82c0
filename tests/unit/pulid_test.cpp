#include "pulid/core/Pulid.hpp"
#include "pulid/core/PulidError.hpp"
#include "pulid/core/Timestamp.hpp"
#include "test_utils/TestUtils.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <functional>
#include <gtest/gtest.h>
#include <string>
#include <string_view>
#include <vector>

namespace
{

using pulid::core::Pulid;
using pulid::core::PulidErrorKind;

constexpr std::uint64_t g_timestamp{ 1469918176385U };

struct GoldenId final
{
    std::string_view base32;
    std::string_view uuid;
    std::uint64_t timestamp;
    std::uint16_t scope;
};

// Reference identifiers published with the upstream Go implementation.
constexpr std::array<GoldenId, 4> g_reference{ {
    { "01JJN0XQ6YZZZN7WGR4NZP1C1Q", "0194AA0E-DCDE-FFFF-53F2-18257F60B037", 1738019888350U, 65535U },
    { "01JJN1CJKQZZZMJDTN8Z2QJ6NQ", "0194AA16-4A77-FFFF-4937-5547C5791AB7", 1738020375159U, 65535U },
    { "01JJN1AD5B08VJ5SRBJAWCBWDQ", "0194AA15-34AB-0237-22E7-0B92B8C5F1B7", 1738020304043U, 567U },
    { "01JJN1CJKQ08VM5AAPPTMCQWZZ", "0194AA16-4A77-0237-42A9-56B6A8CBF3FF", 1738020375159U, 567U },
} };

PulidErrorKind errorKindOf(const std::function<void()>& fn)
{
    try
    {
        fn();
    }
    catch (const pulid::core::PulidError& e)
    {
        return e.kind();
    }
    ADD_FAILURE() << "expected a PulidError";
    return PulidErrorKind::EntropySource;
}

std::string lower(std::string_view s)
{
    std::string out{ s };
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

TEST(Pulid, ComponentsProduceGoldenForms)
{
    const auto entropy{ pulid::test_utils::sequentialEntropy() };
    const Pulid id{ g_timestamp, 1000, entropy };

    EXPECT_EQ(pulid::test_utils::toHex(id.toBytes()), "01563df3648103e80001020304050607");
    EXPECT_EQ(id.toBase32(), "01ARYZ6S410FM000820C20A1G7");
    EXPECT_EQ(id.toUuid(), "01563df3-6481-03e8-0001-020304050607");
    EXPECT_EQ(id.timestamp(), g_timestamp);
    EXPECT_EQ(id.scope(), 1000U);
    EXPECT_EQ(id.storedScope(), 1000U);
    EXPECT_EQ(id.entropy(), entropy);
    EXPECT_EQ(id.time().time_since_epoch().count(), static_cast<std::int64_t>(g_timestamp));
}

TEST(Pulid, ParsesReferenceIdentifiers)
{
    for (const auto& ref : g_reference)
    {
        const auto fromText{ Pulid::fromBase32(ref.base32) };
        EXPECT_EQ(fromText.toUuid(), lower(ref.uuid)) << ref.base32;
        EXPECT_EQ(fromText.timestamp(), ref.timestamp) << ref.base32;
        EXPECT_EQ(fromText.scope(), ref.scope) << ref.base32;

        const auto fromUuid{ Pulid::fromUuid(ref.uuid) };
        EXPECT_EQ(fromUuid.toBase32(), ref.base32) << ref.uuid;
        EXPECT_EQ(fromUuid, fromText);
    }
}

TEST(Pulid, UnscopedInputStoresMaximumAndReadsBackMaximum)
{
    const auto entropy{ pulid::test_utils::sequentialEntropy() };
    const Pulid id{ g_timestamp, 0, entropy };

    EXPECT_EQ(id.storedScope(), 65535U);
    EXPECT_EQ(id.scope(), 65535U);
    EXPECT_EQ(id.toBase32(), "01ARYZ6S41ZZZG00820C20A1G7");
    EXPECT_EQ(id.toUuid(), "01563df3-6481-ffff-0001-020304050607");

    // Every parsing path keeps 65535; none folds it back to 0.
    EXPECT_EQ(Pulid::fromBase32(id.toBase32()).scope(), 65535U);
    EXPECT_EQ(Pulid::fromUuid(id.toUuid()).scope(), 65535U);
    EXPECT_EQ(Pulid::fromBytes(id.toBytes()).scope(), 65535U);

    const Pulid explicitMax{ g_timestamp, 65535, entropy };
    EXPECT_EQ(explicitMax, id);
}

TEST(Pulid, ScopeOutsideDomainIsRangeError)
{
    const auto entropy{ pulid::test_utils::sequentialEntropy() };
    EXPECT_EQ(errorKindOf([&] { Pulid{ g_timestamp, 65536, entropy }; }), PulidErrorKind::Range);
    EXPECT_EQ(errorKindOf([&] { Pulid{ g_timestamp, -1, entropy }; }), PulidErrorKind::Range);
}

TEST(Pulid, TimestampOutsideDomainIsRangeError)
{
    const auto entropy{ pulid::test_utils::sequentialEntropy() };
    constexpr std::uint64_t kTooLarge{ std::uint64_t{ 1U } << 48U };
    EXPECT_EQ(errorKindOf([&] { Pulid{ kTooLarge, 1, entropy }; }), PulidErrorKind::Range);
    EXPECT_NO_THROW((Pulid{ kTooLarge - 1U, 1, entropy }));
}

TEST(Pulid, EntropyMustBeEightBytes)
{
    const std::array<std::uint8_t, 7> shortEntropy{};
    const std::array<std::uint8_t, 9> longEntropy{};
    EXPECT_EQ(errorKindOf([&] { Pulid{ g_timestamp, 1, shortEntropy }; }), PulidErrorKind::Format);
    EXPECT_EQ(errorKindOf([&] { Pulid{ g_timestamp, 1, longEntropy }; }), PulidErrorKind::Format);
}

TEST(Pulid, ComponentValidationOrderReportsTimestampFirst)
{
    const std::array<std::uint8_t, 3> shortEntropy{};
    constexpr std::uint64_t kTooLarge{ std::uint64_t{ 1U } << 48U };
    EXPECT_EQ(errorKindOf([&] { Pulid{ kTooLarge, -5, shortEntropy }; }), PulidErrorKind::Range);
    EXPECT_EQ(errorKindOf([&] { Pulid{ g_timestamp, -5, shortEntropy }; }), PulidErrorKind::Range);
}

TEST(Pulid, StoredZeroScopeIsReservedOnEveryParsePath)
{
    EXPECT_EQ(errorKindOf([] { static_cast<void>(Pulid::fromBase32("01ARYZ6S41000000820C20A1G7")); }),
              PulidErrorKind::ReservedValue);
    EXPECT_EQ(errorKindOf([] { static_cast<void>(Pulid::fromUuid("01563df3-6481-0000-0001-020304050607")); }),
              PulidErrorKind::ReservedValue);
    EXPECT_EQ(errorKindOf([] { static_cast<void>(Pulid::fromBase32("00000000000000000000000000")); }),
              PulidErrorKind::ReservedValue);

    const pulid::core::PulidBytes zeroScope{};
    EXPECT_EQ(errorKindOf([&] { static_cast<void>(Pulid::fromBytes(zeroScope)); }), PulidErrorKind::ReservedValue);
}

TEST(Pulid, MalformedTextIsFormatError)
{
    EXPECT_EQ(errorKindOf([] { static_cast<void>(Pulid::fromBase32("8ZZZZZZZZZZZZZZZZZZZZZZZZZ")); }),
              PulidErrorKind::Format);
    EXPECT_EQ(errorKindOf([] { static_cast<void>(Pulid::fromUuid("01563df3-6481-03e8-0001-02030405060")); }),
              PulidErrorKind::Format);
    EXPECT_EQ(errorKindOf([] { static_cast<void>(Pulid::parse("01ARYZ6S410FM000820C20A1G")); }),
              PulidErrorKind::Format);
    const std::array<std::uint8_t, 15> shortBytes{};
    EXPECT_EQ(errorKindOf([&] { static_cast<void>(Pulid::fromBytes(shortBytes)); }), PulidErrorKind::Format);
}

TEST(Pulid, MaximumEncodableValueParses)
{
    const auto id{ Pulid::fromBase32("7ZZZZZZZZZZZZZZZZZZZZZZZZZ") };
    EXPECT_EQ(id.timestamp(), 281474976710655U);
    EXPECT_EQ(id.scope(), 65535U);
    EXPECT_EQ(id.toUuid(), "ffffffff-ffff-ffff-ffff-ffffffffffff");
}

TEST(Pulid, ParseDispatchesOnLength)
{
    const auto fromText{ Pulid::parse("01ARYZ6S410FM000820C20A1G7") };
    const auto fromUuid{ Pulid::parse("01563DF3-6481-03E8-0001-020304050607") };
    EXPECT_EQ(fromText, fromUuid);
    EXPECT_EQ(fromText.scope(), 1000U);
}

TEST(Pulid, IsValidNeverThrows)
{
    EXPECT_TRUE(Pulid::isValid("01ARYZ6S410FM000820C20A1G7"));
    EXPECT_TRUE(Pulid::isValid("01aryz6s41ofm000820c20a1g7"));
    EXPECT_TRUE(Pulid::isValid("01563df3-6481-03e8-0001-020304050607"));
    EXPECT_FALSE(Pulid::isValid(""));
    EXPECT_FALSE(Pulid::isValid("01ARYZ6S41000000820C20A1G7"));
    EXPECT_FALSE(Pulid::isValid("8ZZZZZZZZZZZZZZZZZZZZZZZZZ"));
    EXPECT_FALSE(Pulid::isValid("not-an-identifier"));
}

TEST(Pulid, RoundTripsThroughEveryForm)
{
    pulid::core::EntropyBytes entropy{};
    for (std::uint16_t scope : { 0, 1, 2, 567, 1000, 40000, 65534, 65535 })
    {
        for (std::size_t i{}; i < entropy.size(); ++i)
        {
            entropy[i] = static_cast<std::uint8_t>(scope * 7U + i * 31U);
        }
        const Pulid id{ g_timestamp + scope, scope, entropy };

        EXPECT_EQ(Pulid::fromBase32(id.toBase32()), id);
        EXPECT_EQ(Pulid::fromUuid(id.toUuid()), id);
        EXPECT_EQ(Pulid::fromBytes(id.toBytes()), id);
        EXPECT_EQ(Pulid::fromUuid(id.toUuid()).scope(), id.scope());
    }
}

TEST(Pulid, LaterTimestampSortsLaterAsText)
{
    pulid::core::EntropyBytes high{};
    high.fill(0xFFU);
    const pulid::core::EntropyBytes low{};

    const std::vector<std::uint64_t> timestamps{ 0U, 1U, 31U, 32U, 1024U, g_timestamp, g_timestamp + 1U,
                                                 pulid::core::g_maxTimestamp };
    for (std::size_t i{ 1U }; i < timestamps.size(); ++i)
    {
        // Worst case for the earlier id: highest scope and entropy; best case for the later one.
        const Pulid earlier{ timestamps[i - 1U], 65535, high };
        const Pulid later{ timestamps[i], 1, low };
        EXPECT_LT(earlier.toBase32(), later.toBase32());
        EXPECT_LT(earlier.toUuid(), later.toUuid());
        EXPECT_LT(earlier, later);
    }
}

TEST(Pulid, OrderingMatchesTextOrdering)
{
    std::vector<Pulid> ids{};
    for (std::uint16_t scope : { 9, 1, 65535, 300 })
    {
        for (std::uint8_t e : { 0x80, 0x01, 0xFE })
        {
            pulid::core::EntropyBytes entropy{};
            entropy.fill(e);
            ids.emplace_back(g_timestamp, scope, entropy);
        }
    }

    std::sort(ids.begin(), ids.end());
    for (std::size_t i{ 1U }; i < ids.size(); ++i)
    {
        EXPECT_LT(ids[i - 1U].toBase32(), ids[i].toBase32());
        EXPECT_LT(ids[i - 1U].toBytes(), ids[i].toBytes());
    }
}

TEST(Pulid, CanonicalizesAliasedInput)
{
    const auto id{ Pulid::fromBase32("o1aryz6s4lofm000820c20a1g7") };
    EXPECT_EQ(id.toBase32(), "01ARYZ6S410FM000820C20A1G7");
}
