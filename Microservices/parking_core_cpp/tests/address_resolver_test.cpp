#include "address_resolver.h"
#include "errors.h"
#include <gtest/gtest.h>
#include <string>

using json = nlohmann::json;
using namespace nprpark;

namespace {

AddressQuery address(const std::string& postcode, int house_number) {
    AddressQuery query;
    query.postcode = postcode;
    query.house_number = house_number;
    return query;
}

ErrorCode resolveError(const PostcodeZoneResolver& resolver, const AddressQuery& query) {
    try {
        resolver.resolveZone(query);
    } catch (const TariffError& e) {
        return e.code();
    }
    ADD_FAILURE() << "address '" << query.postcode << "' was expected to fail";
    return ErrorCode::MALFORMED_TARIFF_DATA;
}

} // namespace

TEST(AddressResolverTest, NormalizesPostcodes) {
    EXPECT_EQ(PostcodeZoneResolver::normalizePostcode("1012AB"), "1012AB");
    EXPECT_EQ(PostcodeZoneResolver::normalizePostcode("1012 ab"), "1012AB");
    EXPECT_EQ(PostcodeZoneResolver::normalizePostcode(" 3511 CD "), "3511CD");
    EXPECT_EQ(PostcodeZoneResolver::normalizePostcode("0123AB"), "");
    EXPECT_EQ(PostcodeZoneResolver::normalizePostcode("1012A"), "");
    EXPECT_EQ(PostcodeZoneResolver::normalizePostcode("101234"), "");
    EXPECT_EQ(PostcodeZoneResolver::normalizePostcode(""), "");
}

TEST(AddressResolverTest, ResolvesByPostcodeArea) {
    PostcodeZoneResolver resolver;
    resolver.loadFromJson({{"1012", "14_TAR01"}, {"3511", "34_TAR01"}});

    EXPECT_EQ(resolver.size(), 2u);
    EXPECT_EQ(resolver.resolveZone(address("1012AB", 1)), "14_TAR01");
    EXPECT_EQ(resolver.resolveZone(address("1012 zz", 120)), "14_TAR01");
    EXPECT_EQ(resolver.resolveZone(address("3511cd", 7)), "34_TAR01");
}

TEST(AddressResolverTest, HouseLetterAndAdditionDoNotChangeTheZone) {
    PostcodeZoneResolver resolver;
    resolver.addMapping("1012", "14_TAR01");

    AddressQuery query = address("1012AB", 12);
    query.house_letter = "a";
    query.house_number_addition = "2";
    EXPECT_EQ(resolver.resolveZone(query), "14_TAR01");
}

TEST(AddressResolverTest, ReportsUnknownAddresses) {
    PostcodeZoneResolver resolver;
    resolver.addMapping("1012", "14_TAR01");

    EXPECT_EQ(resolveError(resolver, address("12AB", 1)), ErrorCode::ADDRESS_NOT_FOUND);
    EXPECT_EQ(resolveError(resolver, address("1012AB", 0)), ErrorCode::ADDRESS_NOT_FOUND);
    EXPECT_EQ(resolveError(resolver, address("9999AA", 1)), ErrorCode::ZONE_NOT_MAPPED);
}

TEST(AddressResolverTest, RejectsBadMappingAndKeepsPreviousOne) {
    PostcodeZoneResolver resolver;
    resolver.loadFromJson({{"1012", "14_TAR01"}});

    EXPECT_THROW(resolver.loadFromJson({{"1013", "14_TAR02"}, {"ABCD", "X"}}), TariffError);
    EXPECT_THROW(resolver.loadFromJson({{"1013", 42}}), TariffError);
    EXPECT_THROW(resolver.loadFromJson(json::array()), TariffError);

    EXPECT_EQ(resolver.size(), 1u);
    EXPECT_EQ(resolver.resolveZone(address("1012AB", 1)), "14_TAR01");
}

TEST(AddressResolverTest, LoadsBundledMapping) {
    PostcodeZoneResolver resolver;
    resolver.loadFromFile(std::string(NPR_PARKING_TEST_DATA_DIR) + "/zone_mapping.json");

    EXPECT_EQ(resolver.size(), 5u);
    EXPECT_EQ(resolver.resolveZone(address("1017 AA", 3)), "14_TAR02");
    EXPECT_THROW(resolver.loadFromFile("/nonexistent/zone_mapping.json"), TariffError);
}

TEST(AddressResolverTest, UsableThroughTheInterface) {
    PostcodeZoneResolver concrete;
    concrete.addMapping("3512", "34_TAR01");
    const AddressResolver& resolver = concrete;
    EXPECT_EQ(resolver.resolveZone(address("3512JK", 5)), "34_TAR01");
}
