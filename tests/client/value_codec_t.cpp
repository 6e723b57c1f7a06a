#include <gtest/gtest.h>
#include <ledger/client/value_codec.hxx>
#include <map>
#include <string>
#include <vector>

using namespace ledger;

struct Vehicle {
    std::string vin;
    int year;
};

void
to_json(nlohmann::json& j, const Vehicle& v)
{
    j = nlohmann::json{ { "VIN", v.vin }, { "Year", v.year } };
}

struct Unconvertible {
};

void
to_json(nlohmann::json&, const Unconvertible&)
{
    throw std::runtime_error("no conversion");
}

TEST(ValueCodecTests, DecodesWhatItEncodes)
{
    auto value = nlohmann::json::parse(R"({"VIN": "1N4AL11D75C109151", "Owners": [{"GovId": "LEWISR261LL"}], "Mileage": 14000})");
    ASSERT_EQ(value, value_codec::decode(value_codec::encode(value)));
}

TEST(ValueCodecTests, EncodingIsDeterministic)
{
    auto a = nlohmann::json::parse(R"({"b": 1, "a": 2})");
    auto b = nlohmann::json::parse(R"({"a": 2, "b": 1})");
    ASSERT_EQ(value_codec::encode(a), value_codec::encode(b));
}

TEST(ValueCodecTests, DistinctValuesEncodeDifferently)
{
    ASSERT_NE(value_codec::encode(nlohmann::json(1)), value_codec::encode(nlohmann::json("1")));
    ASSERT_NE(value_codec::encode(nlohmann::json(nullptr)), value_codec::encode(nlohmann::json(false)));
}

TEST(ValueCodecTests, CanConvertCustomTypes)
{
    auto value = value_codec::to_value(Vehicle{ "KM8SRDHF6EU074761", 2015 });
    ASSERT_EQ("KM8SRDHF6EU074761", value["VIN"].get<std::string>());
    ASSERT_EQ(2015, value["Year"].get<int>());
}

TEST(ValueCodecTests, CanConvertStandardTypes)
{
    ASSERT_EQ(nlohmann::json("text"), value_codec::to_value(std::string("text")));
    ASSERT_EQ(nlohmann::json::array({ 1, 2, 3 }), value_codec::to_value(std::vector<int>{ 1, 2, 3 }));
    std::map<std::string, double> m{ { "pi", 3.14 } };
    ASSERT_EQ(3.14, value_codec::to_value(m)["pi"].get<double>());
}

TEST(ValueCodecTests, FailedConversionThrows)
{
    ASSERT_THROW(value_codec::to_value(Unconvertible{}), value_conversion_error);
}

TEST(ValueCodecTests, DiscardedValueCannotBeEncoded)
{
    ASSERT_THROW(static_cast<void>(value_codec::encode(nlohmann::json(nlohmann::json::value_t::discarded))), value_conversion_error);
}

TEST(ValueCodecTests, GarbageCannotBeDecoded)
{
    ASSERT_THROW(static_cast<void>(value_codec::decode(std::string("\xff\xff", 2))), value_conversion_error);
    ASSERT_THROW(static_cast<void>(value_codec::decode(std::string())), value_conversion_error);
}
