#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <JsonFork/annotated.hpp>
#include <JsonFork/either.hpp>
#include <JsonFork/generic_streamer.hpp>
#include <JsonFork/option.hpp>
#include <JsonFork/options.hpp>
#include <JsonFork/reader.hpp>
#include <JsonFork/static_schema.hpp>
#include <JsonFork/struct_fields_helper.hpp>
#include <JsonFork/writer.hpp>

using namespace JsonFork;
using namespace JsonFork::options;
using namespace JsonFork::static_schema;

static_assert(JsonString<std::string>);
static_assert(JsonNumber<int> && JsonNumber<double> && !JsonNumber<bool>);
static_assert(JsonNullableValue<std::optional<int>>);
static_assert(JsonDynamicArray<std::vector<int>>);
static_assert(!JsonDynamicArray<std::string>);
static_assert(JsonFixedArray<std::array<int, 2>>);
static_assert(JsonMap<std::map<std::string, int>>);
static_assert(JsonMap<std::map<int, int>>);
static_assert(!JsonMap<std::map<double, int>>);
static_assert(ConsumingStreamerLike<streamers::CountingStreamer<int>>);
static_assert(JsonArray<streamers::CountingStreamer<int>>);
static_assert(!JsonObject<RawValue>);

using Reader = StringReader<>;
using Writer = TokenWriter<StringSink>;

static_assert(HasUnmarshalHook<Either<int, std::string>, Reader>);
static_assert(HasMarshalHook<Either<int, std::string>, Writer>);
static_assert(HasUnmarshalHook<Option<int>, Reader>);
static_assert(HasMarshalHook<Und<int>, Writer>);
static_assert(!HasUnmarshalHook<std::vector<int>, Reader>);

struct Fields {
    Annotated<int, key<"renamed">> a;
    Annotated<int, exclude> b;
    int c;
    Annotated<std::map<std::string, RawValue>, unknown_members> rest;
};

using FH = struct_fields_helper::FieldsHelper<Fields>;

static_assert(FH::rawFieldsCount == 4);
static_assert(FH::fieldsCount == 2);
static_assert(FH::find("renamed") == 0);
static_assert(FH::find("a") == FH::npos);
static_assert(FH::find("b") == FH::npos);
static_assert(FH::fieldIndexesToFieldNames[FH::find("c")].index == 2);
static_assert(FH::unknownSinkIndex == 3);
static_assert(struct_fields_helper::fieldOmitsZero<Fields, 0>() == false);
