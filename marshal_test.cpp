#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "marshal.hpp"
#include <array>
#include <atomic>
#include <format>
#include <map>
#include <set>
#include <sstream>
#include <thread>

using namespace marshal;
using namespace std::chrono_literals;

//=============================================================================
// Test type definitions
//=============================================================================

struct Point {
    Field<float, "x"> x;
    Field<float, "y"> y;

    friend bool operator==(Point const&, Point const&) = default;
};

struct Line {
    Field<Point, "start"> start;
    Field<Point, "finish"> finish;

    friend bool operator==(Line const&, Line const&) = default;
};

struct WithDefaults {
    Field<std::string, "name"> name;
    Field<int, "retries"> retries = 3;
    Field<std::optional<int>, "timeout"> timeout;
};

struct Person {
    Field<Annotated<std::string, alias<"n", "nm">>, "name"> name;
    Field<Annotated<int, path<"data.items[0].id">>, "firstId"> firstId;
};

struct Account {
    Field<std::string, "user_name"> userName;
    Field<Annotated<std::string, exclude>, "password"> password = std::string();
    Field<Annotated<std::optional<int>, skip_if_null>, "quota"> quota;
};

struct Settings {
    Field<int, "retries"> retries = 3;
    Field<std::string, "mode"> mode = std::string("fast");
    Field<int, "level"> level;

    static Config marshalConfig() { return { .skipDefaults = true }; }
};

struct Loose {
    Field<std::string, "name"> name;
    Field<Annotated<std::map<std::string, Value>, catch_all>, "extra"> extra;
};

struct Strict {
    Field<int, "a"> a;
    Field<int, "b"> b = 0;

    static Config marshalConfig() { return { .onUnknownKey = UnknownKeyAction::raise }; }
};

struct Plain {
    Field<int, "a"> a;
};

struct Pair2 {
    Field<int, "a"> a;
    Field<int, "b"> b;
};

struct Node {
    Field<std::shared_ptr<Node>, "next"> next;
};

struct Tree {
    Field<int, "value"> value;
    Field<std::vector<Tree>, "children"> children = std::vector<Tree>();
};

enum class Color { red, green, blue };

inline std::array<EnumMember<Color>, 3> enumMembers(Color)
{
    return {{ { Color::red, "red", "r" }, { Color::green, "green", "g" }, { Color::blue, "blue", "b" } }};
}

enum class Level { low, high };

inline std::array<EnumMember<Level>, 2> enumMembers(Level)
{
    return {{ { Level::low, "low", 1 }, { Level::high, "high", 2 } }};
}

struct Coordinates {
    int left;
    std::string right;
};

struct Containers {
    Field<std::vector<int>, "numbers"> numbers;
    Field<std::set<int>, "unique"> unique;
    Field<std::map<int, std::string>, "names"> names;
    Field<std::tuple<int, std::string>, "pair"> pair;
    Field<std::array<int, 3>, "triple"> triple;
    Field<std::vector<std::byte>, "blob"> blob;
    Field<Color, "color"> color;
};

struct WithCoordinates {
    Field<Coordinates, "coordinates"> coordinates;
};

struct Meeting {
    Field<Instant, "at"> at;
    Field<Annotated<std::chrono::year_month_day, pattern<"%d/%m/%Y">>, "day"> day;
    Field<std::chrono::seconds, "length"> length;
};

struct Alarm {
    Field<TimeOfDay, "ring"> ring;
};

struct Cat {
    Field<std::string, "name"> name;
    static Config marshalConfig() { return { .tag = "A" }; }
};

struct Dog {
    Field<std::string, "name"> name;
    Field<bool, "good"> good = true;
    static Config marshalConfig() { return { .tag = "B" }; }
};

struct Pet {
    Field<std::variant<Cat, Dog>, "animal"> animal;
    static Config marshalConfig() { return { .tagKey = "t" }; }
};

struct Circle {
    Field<double, "radius"> radius;
};

struct Square {
    Field<double, "side"> side;
};

struct Drawing {
    Field<std::variant<Circle, Square>, "shape"> shape;
    static Config marshalConfig() { return { .autoAssignTags = true }; }
};

struct Twin1 {
    Field<int, "v"> v;
    static Config marshalConfig() { return { .tag = "same" }; }
};

struct Twin2 {
    Field<int, "w"> w;
    static Config marshalConfig() { return { .tag = "same" }; }
};

struct Twins {
    Field<std::variant<Twin1, Twin2>, "twin"> twin;
};

class Opaque
{
public:
    Opaque() = default;

private:
    int state = 0;
};

class Version
{
public:
    Version() = default;
    explicit Version(std::string s) : text(std::move(s)) {}

    std::string const& str() const { return text; }

    friend std::ostream& operator<<(std::ostream& os, Version const& v) { return os << v.text; }

private:
    std::string text;
};

class Money
{
public:
    Money() = default;
    explicit Money(std::int64_t c) : cents(c) {}

    std::int64_t value() const { return cents; }

private:
    std::int64_t cents = 0;
};

class Ticket
{
public:
    int id = 0;

private:
    int checksum = 0;
};

struct WithOpaque {
    Field<Opaque, "opaque"> opaque;
};

struct Release {
    Field<Version, "version"> version;
    Field<Money, "price"> price;
    Field<Ticket, "ticket"> ticket;
};

struct Broken {
    Field<Opaque, "opaque"> opaque;
    Field<Annotated<int, pattern<"%Y">>, "year"> year;
    Field<Annotated<int, path<"a[">>, "bad"> bad;
};

struct Nested {
    Field<Plain, "inner"> inner;
    Field<int, "count"> count;
};

struct Propagating {
    Field<Nested, "nested"> nested;
    static Config marshalConfig() { return { .keyCasingLoad = KeyCase::automatic }; }
};

struct CamelInner {
    Field<int, "item_count"> itemCount;
};

struct NonPropagating {
    Field<CamelInner, "inner_value"> innerValue;
    static Config marshalConfig() { return { .keyCasingLoad = KeyCase::camel, .recursive = false }; }
};

struct CamelOuter {
    Field<CamelInner, "inner_value"> innerValue;
};

struct Fresh1 { Field<int, "a"> a; Field<Point, "p"> p; };

//=============================================================================
// Value tests
//=============================================================================

TEST_SUITE("Value") {

TEST_CASE("type and predicates") {
    CHECK(Value().isNull());
    CHECK(Value(true).isBool());
    CHECK(Value(42).isInteger());
    CHECK(Value(1.5).isFloating());
    CHECK(Value("text").isString());
    CHECK(Value(Sequence { 1, 2 }).isSequence());
    CHECK(Value(Map { { "a", 1 } }).isMap());
    CHECK(Value(42).typeName() == "integer");
}

TEST_CASE("numbers compare across integer and float") {
    CHECK(Value(2) == Value(2.0));
    CHECK_FALSE(Value(2) == Value("2"));
    CHECK(Value(1) < Value(1.5));
}

TEST_CASE("map equality ignores insertion order") {
    Value a = Map { { "x", 1 }, { "y", 2 } };
    Value b = Map { { "y", 2 }, { "x", 1 } };
    CHECK(a == b);
}

TEST_CASE("repr and toText") {
    Value v = Map { { "a", Sequence { 1, "b", nullptr } } };
    CHECK(v.repr() == "{\"a\": [1, \"b\", null]}");
    CHECK(Value("plain").toText() == "plain");
    CHECK(std::format("{}", Value(true)) == "true");
}

TEST_CASE("map keeps insertion order") {
    Map map;
    map.insertOrAssign("b", 1);
    map.insertOrAssign("a", 2);
    map.insertOrAssign("b", 3);

    REQUIRE(map.size() == 2);
    CHECK(map.begin()->key == Value("b"));
    CHECK(*map.find("b") == Value(3));
    CHECK(map.erase("b"));
    CHECK_FALSE(map.contains("b"));
}

} // TEST_SUITE("Value")

//=============================================================================
// Error tests
//=============================================================================

TEST_SUITE("Errors") {

TEST_CASE("path attribution") {
    Error error(ErrorKind::typeMismatch, "expected float, got string \"a\"", Value("a"));
    error.prependIndex(2);
    error.prependField("points");
    error.inRecord("Inner");
    error.inRecord("Outer");

    CHECK(error.pathString() == "points[2]");
    CHECK(error.record() == "Outer");
    CHECK(std::string(error.what()) == "Outer.points[2]: expected float, got string \"a\"");
}

TEST_CASE("map keys in paths") {
    Error error(ErrorKind::missingField, "missing");
    error.prependKey("k");
    error.prependField("table");
    CHECK(error.pathString() == "table[\"k\"]");
}

TEST_CASE("aggregate flattens and propagates attribution") {
    auto inner = Error::aggregate({ Error(ErrorKind::missingField, "one"), Error(ErrorKind::missingField, "two") });
    auto outer = Error::aggregate({ inner, Error(ErrorKind::unknownKey, "three") });
    outer.prependField("f");

    CHECK(outer.kind() == ErrorKind::aggregate);
    REQUIRE(outer.errors().size() == 3);
    CHECK(outer.errors()[0].pathString() == "f");
    CHECK(outer.errors()[2].kind() == ErrorKind::unknownKey);
}

TEST_CASE("typeMismatch message") {
    auto error = typeMismatch("integer", Value("x"));
    CHECK(error.kind() == ErrorKind::typeMismatch);
    CHECK(error.message() == "expected integer, got string \"x\"");
    REQUIRE(error.value().has_value());
    CHECK(*error.value() == Value("x"));
}

} // TEST_SUITE("Errors")

//=============================================================================
// Logging tests
//=============================================================================

TEST_SUITE("Logging") {

TEST_CASE("sink receives messages at or above the level") {
    std::vector<std::string> lines;
    auto previous = setLogSink([&lines] (LogLevel, std::string_view message) { lines.emplace_back(message); });
    auto const previousLevel = logLevel();

    auto restore = detail::callAtEndOfScope([&]
    {
        setLogSink(previous);
        setLogLevel(previousLevel);
    });

    setLogLevel(LogLevel::info);
    marshal::log(LogLevel::debug, "hidden {}", 1);
    marshal::log(LogLevel::info, "shown {}", 2);
    marshal::log(LogLevel::error, "also shown");

    REQUIRE(lines.size() == 2);
    CHECK(lines[0] == "shown 2");
    CHECK(toString(LogLevel::warning) == "warning");
}

TEST_CASE("a sink may log itself") {
    std::vector<std::string> lines;
    auto previous = setLogSink([&lines] (LogLevel, std::string_view message)
    {
        lines.emplace_back(message);

        if (lines.size() == 1)
            marshal::log(LogLevel::error, "from the sink");
    });

    auto restore = detail::callAtEndOfScope([&] { setLogSink(previous); });

    marshal::log(LogLevel::error, "outer");

    REQUIRE(lines.size() == 2);
    CHECK(lines[0] == "outer");
    CHECK(lines[1] == "from the sink");
}

} // TEST_SUITE("Logging")

//=============================================================================
// Key casing and key paths
//=============================================================================

TEST_SUITE("Key casing") {

TEST_CASE("transforms") {
    CHECK(toCamelCase("my_field_name") == "myFieldName");
    CHECK(toPascalCase("my_field_name") == "MyFieldName");
    CHECK(toKebabCase("myFieldName") == "my-field-name");
    CHECK(toSnakeCase("MyFieldName") == "my_field_name");
    CHECK(toSnakeCase("my-field") == "my_field");
    CHECK(applyKeyCase(KeyCase::none, "keep_Me") == "keep_Me");
}

TEST_CASE("field keys under automatic casing") {
    Config config { .keyCasingLoad = KeyCase::automatic };
    auto keys = resolveFieldKeys("user_name", {}, config);

    REQUIRE(keys.load.size() == 4);
    CHECK(keys.load[0] == KeyPath("user_name"));
    CHECK(keys.load[1] == KeyPath("userName"));
    CHECK(keys.load[2] == KeyPath("UserName"));
    CHECK(keys.load[3] == KeyPath("user-name"));
    CHECK(keys.dump == KeyPath("user_name"));
}

TEST_CASE("explicit aliases come first and the first one is dumped") {
    FieldOptions options { .loadAliases = { "n", "nm" } };
    auto keys = resolveFieldKeys("name", options, Config { .keyCasingDump = KeyCase::pascal });

    REQUIRE(keys.load.size() == 3);
    CHECK(keys.load[0] == KeyPath("n"));
    CHECK(keys.load[2] == KeyPath("name"));
    CHECK(keys.dump == KeyPath("n"));
}

TEST_CASE("dump alias wins over load aliases") {
    FieldOptions options { .loadAliases = { "n" }, .dumpAlias = KeyPath("out") };
    CHECK(resolveFieldKeys("name", options, {}).dump == KeyPath("out"));
}

} // TEST_SUITE("Key casing")

TEST_SUITE("KeyPath") {

TEST_CASE("parse and render") {
    auto path = KeyPath::parse("data.items[0].id");
    REQUIRE(path.segments().size() == 4);
    CHECK(std::get<std::int64_t>(path.segments()[2]) == 0);
    CHECK(path.toString() == "data.items[0].id");
    CHECK(path.head() == "data");
    CHECK_FALSE(path.isFlat());

    auto quoted = KeyPath::parse("a[\"x.y\"]");
    REQUIRE(quoted.segments().size() == 2);
    CHECK(std::get<std::string>(quoted.segments()[1]) == "x.y");
}

TEST_CASE("malformed paths") {
    for (auto notation : { "", "a[", "a..b", "a.", "a[]" })
    {
        CAPTURE(notation);
        CHECK_THROWS_AS(KeyPath::parse(notation), Error);
    }
}

TEST_CASE("lookup") {
    Value root = Map { { "a", Map { { "b", Sequence { 10, 20, 30 } } } } };

    REQUIRE(KeyPath::parse("a.b[1]").lookup(root) != nullptr);
    CHECK(*KeyPath::parse("a.b[1]").lookup(root) == Value(20));
    CHECK(*KeyPath::parse("a.b[-1]").lookup(root) == Value(30));
    CHECK(KeyPath::parse("a.b[5]").lookup(root) == nullptr);
    CHECK(KeyPath::parse("a.c").lookup(root) == nullptr);
}

TEST_CASE("assign creates intermediate containers") {
    Value root;
    KeyPath::parse("a.b[1].c").assign(root, 5);

    CHECK(root == Value(Map { { "a", Map { { "b", Sequence { nullptr, Map { { "c", 5 } } } } } } }));
}

TEST_CASE("assign with negative indices") {
    Value root = Map { { "a", Sequence { 1, 2 } } };

    KeyPath::parse("a[-1]").assign(root, 5);
    CHECK(*root.as<Map>().find("a") == Value(Sequence { 1, 5 }));

    try
    {
        KeyPath::parse("b[-1]").assign(root, 5);
        FAIL("expected an error for an index before the start");
    }
    catch (Error const& e)
    {
        CHECK(e.kind() == ErrorKind::descriptorResolution);
        CHECK(std::string(e.what()).find("b[-1]") != std::string::npos);
    }

    CHECK_THROWS_AS(KeyPath::parse("a[-3]").assign(root, 5), Error);
}

} // TEST_SUITE("KeyPath")

//=============================================================================
// Configuration tests
//=============================================================================

TEST_SUITE("Config") {

TEST_CASE("own options win over inherited ones") {
    Config own { .keyCasingLoad = KeyCase::camel };
    Config inherited { .keyCasingLoad = KeyCase::snake, .onUnknownKey = UnknownKeyAction::warn };

    auto merged = Config::merge(own, inherited);
    CHECK(merged.keyCasingLoad == KeyCase::camel);
    CHECK(merged.onUnknownKey == UnknownKeyAction::warn);
}

TEST_CASE("record scoped options are never inherited") {
    Config inherited { .fields = { { "a", FieldOptions { .exclude = true } } }, .tag = "T", .recursive = false };
    auto merged = Config::merge({}, inherited);

    CHECK(merged.fields.empty());
    CHECK_FALSE(merged.tag.has_value());
    CHECK(merged.propagates());
}

TEST_CASE("fingerprints") {
    Config a { .keyCasingLoad = KeyCase::camel, .skipIf = Condition::eq(0) };
    Config b { .keyCasingLoad = KeyCase::camel, .skipIf = Condition::eq(0) };
    Config c { .keyCasingLoad = KeyCase::camel, .skipIf = Condition::eq(1) };

    CHECK(a.fingerprint() == b.fingerprint());
    CHECK(a.fingerprint() != c.fingerprint());
    CHECK(Config {}.fingerprint() != a.fingerprint());
}

TEST_CASE("call site options address the record itself") {
    Config own { .fields = { { "a", FieldOptions { .dumpAlias = KeyPath("A") } } }, .tag = "own" };
    Config caller { .fields = { { "a", FieldOptions { .loadAliases = { "alpha" } } }, { "b", FieldOptions { .exclude = true } } },
                    .tag = "called", .recursive = false };

    auto effective = Config::atCallSite(own, caller);
    REQUIRE(effective.fieldOptions("a") != nullptr);
    CHECK(effective.fieldOptions("a")->dumpAlias == KeyPath("A"));
    CHECK(effective.fieldOptions("a")->loadAliases == std::vector<KeyPath> { "alpha" });
    CHECK(effective.fieldOptions("b")->exclude);
    CHECK(effective.tag == "called");
    CHECK_FALSE(effective.propagates());

    CHECK(Config::atCallSite(own, {}).tag == "own");
    CHECK(Config::merge({}, effective).fields.empty());
}

TEST_CASE("fingerprints keep separators inside values apart") {
    FieldOptions joined { .loadAliases = { "a,b" } };
    FieldOptions split { .loadAliases = { "a", "b" } };
    CHECK(joined.fingerprint() != split.fingerprint());

    Config first { .fields = { { "x", joined } } };
    Config second { .fields = { { "x", split } } };
    CHECK(first.fingerprint() != second.fingerprint());

    CHECK(Config { .tagKey = "a;tk=b" }.fingerprint() != Config { .tagKey = "a", .tag = "b" }.fingerprint());
}

TEST_CASE("tag key") {
    CHECK(Config {}.effectiveTagKey() == "__tag__");
    CHECK(Config { .tagKey = "t" }.effectiveTagKey() == "t");
}

TEST_CASE("conditions") {
    CHECK(Condition::eq(0)(Value(0.0)));
    CHECK(Condition::gt(1)(Value(2)));
    CHECK_FALSE(Condition::lt(1)(Value(2)));
    CHECK(Condition::isFalsy()(Value("")));
    CHECK(Condition::isNull()(Value()));
    CHECK(Condition::ge(3).describe() == ">= 3");
}

TEST_CASE("field overrides win over annotations") {
    FieldOptions annotated { .loadAliases = { "a" }, .exclude = false };
    annotated.mergeFrom(FieldOptions { .loadAliases = { "b" }, .exclude = true });

    REQUIRE(annotated.loadAliases.size() == 1);
    CHECK(annotated.loadAliases[0] == KeyPath("b"));
    CHECK(annotated.exclude);
}

} // TEST_SUITE("Config")

//=============================================================================
// Coercion tests
//=============================================================================

TEST_SUITE("Coercion") {

TEST_CASE("boolean coercion") {
    CHECK(loadBool(Value("TRUE")));
    CHECK(loadBool(Value(" yes ")));
    CHECK(loadBool(Value("Y")));
    CHECK(loadBool(Value("1")));
    CHECK(loadBool(Value(1)));
    CHECK(loadBool(Value(1.0)));
    CHECK_FALSE(loadBool(Value("0")));
    CHECK_FALSE(loadBool(Value("no")));
    CHECK_FALSE(loadBool(Value("off")));
    CHECK_FALSE(loadBool(Value(0)));
    CHECK_FALSE(loadBool(Value(2)));
    CHECK_FALSE(loadBool(Value()));
}

TEST_CASE("integers round half to even") {
    CHECK(loadInteger(Value(2.5)) == 2);
    CHECK(loadInteger(Value(3.5)) == 4);
    CHECK(loadInteger(Value("7")) == 7);
    CHECK(loadInteger(Value("7.0")) == 7);
    CHECK_THROWS_AS(loadInteger(Value(2.5), FractionalIntegers::reject), Error);
    CHECK_THROWS_AS(loadInteger(Value(true)), Error);
    CHECK_THROWS_AS(loadInteger(Value("seven")), Error);
}

TEST_CASE("floats and strings") {
    CHECK(loadFloat(Value("1.5")) == doctest::Approx(1.5));
    CHECK(loadFloat(Value(2)) == doctest::Approx(2.0));
    CHECK(loadString(Value(3)) == "3");
    CHECK(loadString(Value()) == "");
    CHECK_THROWS_AS(loadString(Value(Sequence {})), Error);
}

TEST_CASE("base64") {
    std::string const hello = "hello";
    std::vector<std::byte> bytes;

    for (auto c : hello)
        bytes.push_back(static_cast<std::byte>(c));

    CHECK(encodeBase64(bytes) == "aGVsbG8=");
    CHECK(decodeBase64("aGVsbG8=") == bytes);
    CHECK_FALSE(decodeBase64("a$").has_value());
}

TEST_CASE("date and time") {
    auto const expected = Instant(std::chrono::sys_days(std::chrono::year(2024) / 3 / 1) + 10h + 30min);

    CHECK(loadDateTime(Value("2024-03-01T10:30:00Z")) == expected);
    CHECK(loadDateTime(Value("2024-03-01T12:30:00+02:00")) == expected);
    CHECK(loadDateTime(Value("2024-03-01 10:30:00")) == expected);
    CHECK(formatDateTime(expected) == "2024-03-01T10:30:00Z");
    CHECK(dumpDateTime(expected, DateTimeOutput::timestamp) == Value(1709289000));
}

TEST_CASE("custom patterns and failures") {
    std::vector<std::string> const patterns { "%d/%m/%Y" };
    auto const expected = std::chrono::year(2024) / std::chrono::April / 5;

    CHECK(loadDate(Value("05/04/2024"), patterns) == expected);

    try
    {
        loadDate(Value("nonsense"), patterns);
        FAIL("expected a pattern parse failure");
    }
    catch (Error const& e)
    {
        CHECK(e.kind() == ErrorKind::patternParse);
        CHECK(std::string(e.what()).find("%d/%m/%Y") != std::string::npos);
    }
}

TEST_CASE("times of day") {
    CHECK(loadTime(Value("10:30")) == 10h + 30min);
    CHECK(loadTime(Value("08:15:30")) == 8h + 15min + 30s);
    CHECK(loadTime(Value("08:15:30.5")) == 8h + 15min + 30s + 500ms);
    CHECK(loadTime(Value("08:15:30Z")) == 8h + 15min + 30s);
    CHECK(loadTime(Value("00:00:00")) == 0us);
    CHECK(loadTime(Value("23:59:59.999999")) == 23h + 59min + 59s + 999999us);

    CHECK(dumpTime(23h + 59min + 59s + 999999us) == Value("23:59:59.999999"));
    CHECK(dumpTime(10h) == Value("10:00:00"));
    CHECK(dumpTime(8h + 15min + 30s + 500ms) == Value("08:15:30.500000"));
    CHECK_THROWS_AS(dumpTime(24h), Error);
}

TEST_CASE("malformed times of day") {
    for (auto text : { "24:00", "23:60", "12:30:60", "7:30", "12:30:00.", "12:30:00.1234567", "12:30:00.12a", "12:30:00+02:00", "noon" })
    {
        CAPTURE(text);

        try
        {
            loadTime(Value(text));
            FAIL("expected a pattern parse failure");
        }
        catch (Error const& e)
        {
            CHECK(e.kind() == ErrorKind::patternParse);
        }
    }

    CHECK_THROWS_AS(loadTime(Value(3600)), Error);
}

TEST_CASE("durations") {
    CHECK(loadDuration(Value("01:30:00")).count() == doctest::Approx(5400.0));
    CHECK(loadDuration(Value(2.5)).count() == doctest::Approx(2.5));
    CHECK(dumpDuration(std::chrono::duration<double>(90.0)) == Value(90));
    CHECK_THROWS_AS(loadDuration(Value("soon")), Error);
}

} // TEST_SUITE("Coercion")

//=============================================================================
// Descriptor resolution
//=============================================================================

TEST_SUITE("Descriptor") {

TEST_CASE("optionals unwrap into the descriptor") {
    ResolveContext context;
    auto descriptor = resolve(metaTypeOf<std::optional<std::vector<int>>>(), context);

    CHECK(descriptor.kind == Kind::sequence);
    CHECK(descriptor.inOptional());
    REQUIRE(descriptor.arguments.size() == 1);
    CHECK(descriptor.arguments[0].kind == Kind::integer);
    CHECK(descriptor.describe() == "optional<sequence<integer>>");
}

TEST_CASE("iteration indices are unique within a field") {
    ResolveContext context;
    context.fieldOrdinal = 4;
    auto descriptor = resolve(metaTypeOf<std::map<std::string, std::vector<int>>>(), context);

    CHECK(descriptor.binding() == "f4_v0");
    CHECK(descriptor.arguments[0].binding() == "f4_v1");
    CHECK(descriptor.arguments[1].binding() == "f4_v2");
    CHECK(descriptor.arguments[1].arguments[0].binding() == "f4_v3");
}

TEST_CASE("records on the compile stack are recursive") {
    CompileStack stack { metaTypeOf<Node>().typeIndex() };
    auto descriptor = resolveField(metaTypeOf<Node>().fields()[0], 0, {}, stack);

    CHECK(descriptor.kind == Kind::record);
    CHECK(descriptor.recursive);
}

TEST_CASE("annotations end up in the descriptor") {
    auto const& meta = metaTypeOf<Person>();
    auto descriptor = resolveField(meta.fields()[1], 1, {}, {});

    CHECK(descriptor.kind == Kind::integer);
    REQUIRE(descriptor.annotations.loadAliases.size() == 1);
    CHECK(descriptor.annotations.loadAliases[0].toString() == "data.items[0].id");
}

TEST_CASE("patterns on a non temporal field are rejected") {
    auto const& meta = metaTypeOf<Broken>();
    CHECK_THROWS_AS(resolveField(meta.fields()[1], 1, {}, {}), Error);
}

TEST_CASE("kinds") {
    CHECK(metaTypeOf<Value>().kind() == Kind::any);
    CHECK(metaTypeOf<std::uint8_t>().kind() == Kind::integer);
    CHECK(metaTypeOf<Color>().kind() == Kind::enumeration);
    CHECK(metaTypeOf<std::set<int>>().kind() == Kind::set);
    CHECK(metaTypeOf<std::pair<int, int>>().kind() == Kind::fixedTuple);
    CHECK(metaTypeOf<Coordinates>().kind() == Kind::namedTuple);
    CHECK(metaTypeOf<Point>().kind() == Kind::record);
    CHECK(metaTypeOf<std::variant<int, std::string>>().kind() == Kind::sum);
    CHECK(metaTypeOf<std::unique_ptr<int>>().kind() == Kind::optional);
    CHECK(metaTypeOf<Opaque>().kind() == Kind::custom);
    CHECK(metaTypeOf<TimeOfDay>().kind() == Kind::time);
    CHECK(metaTypeOf<Point>().name() == "Point");
}

} // TEST_SUITE("Descriptor")

//=============================================================================
// Record routines
//=============================================================================

TEST_SUITE("Records") {

TEST_CASE("load and dump") {
    Value input = Map { { "start", Map { { "x", 1.5 }, { "y", 2 } } }, { "finish", Map { { "x", 3 }, { "y", 4 } } } };
    auto line = load<Line>(input);

    CHECK(line.start().x() == doctest::Approx(1.5f));
    CHECK(line.finish().y() == doctest::Approx(4.0f));
    CHECK(dump(line) == input);
    CHECK(load<Line>(dump(line)) == line);
}

TEST_CASE("errors carry the record and field path") {
    Value input = Map { { "start", Map { { "x", "a" }, { "y", 2 } } }, { "finish", Map { { "x", 3 }, { "y", 4 } } } };

    try
    {
        load<Line>(input);
        FAIL("expected a type mismatch");
    }
    catch (Error const& e)
    {
        CHECK(e.kind() == ErrorKind::typeMismatch);
        CHECK(e.record() == "Line");
        CHECK(e.pathString() == "start.x");
        CHECK(std::string(e.what()).starts_with("Line.start.x: expected float"));
    }
}

TEST_CASE("defaults and missing fields") {
    auto loaded = load<WithDefaults>(Map { { "name", "n" } });
    CHECK(loaded.retries() == 3);
    CHECK_FALSE(loaded.timeout().has_value());

    try
    {
        load<WithDefaults>(Map { { "retries", 1 } });
        FAIL("expected a missing field");
    }
    catch (Error const& e)
    {
        CHECK(e.kind() == ErrorKind::missingField);
        CHECK(e.pathString() == "name");
    }
}

TEST_CASE("first matching alias wins") {
    Value input = Map { { "nm", "b" }, { "n", "a" }, { "data", Map { { "items", Sequence { Map { { "id", 7 } } } } } } };
    auto person = load<Person>(input);

    CHECK(person.name() == "a");
    CHECK(person.firstId() == 7);

    auto dumped = dump(person);
    CHECK(dumped == Value(Map { { "n", "a" }, { "data", Map { { "items", Sequence { Map { { "id", 7 } } } } } } }));
}

TEST_CASE("missing path segments fall back to the default or fail") {
    CHECK_THROWS_AS(load<Person>(Map { { "name", "x" }, { "data", Map {} } }), Error);
}

TEST_CASE("automatic load casing") {
    Config config { .keyCasingLoad = KeyCase::automatic };

    CHECK(load<Account>(Map { { "userName", "a" } }, config).userName() == "a");
    CHECK(load<Account>(Map { { "user-name", "b" } }, config).userName() == "b");
    CHECK(load<Account>(Map { { "user_name", "c" } }, config).userName() == "c");
}

TEST_CASE("dump casing, exclusion and skip conditions") {
    Account account;
    account.userName = std::string("root");
    account.password = std::string("secret");

    auto dumped = dump(account, Config { .keyCasingDump = KeyCase::camel });
    CHECK(dumped == Value(Map { { "userName", "root" } }));

    account.quota = std::optional<int>(5);
    CHECK(dump(account) == Value(Map { { "user_name", "root" }, { "quota", 5 } }));
}

TEST_CASE("record wide skip condition") {
    WithDefaults value;
    value.name = std::string("");
    value.retries = 0;

    CHECK(dump(value, Config { .skipIf = Condition::isFalsy() }) == Value(Map {}));
}

TEST_CASE("skip defaults") {
    Settings settings;
    CHECK(dump(settings) == Value(Map { { "level", 0 } }));

    settings.retries = 5;
    settings.mode = std::string("slow");
    CHECK(dump(settings) == Value(Map { { "retries", 5 }, { "mode", "slow" }, { "level", 0 } }));
}

TEST_CASE("catch-all field") {
    auto loose = load<Loose>(Map { { "name", "n" }, { "x", 1 }, { "y", "z" } });

    CHECK(loose.name() == "n");
    REQUIRE(loose.extra().size() == 2);
    CHECK(loose.extra().at("x") == Value(1));

    CHECK(dump(loose) == Value(Map { { "name", "n" }, { "x", 1 }, { "y", "z" } }));
}

TEST_CASE("unknown keys raise naming the key and the fields") {
    try
    {
        load<Strict>(Map { { "a", 1 }, { "z", 2 } });
        FAIL("expected an unknown key error");
    }
    catch (Error const& e)
    {
        CHECK(e.kind() == ErrorKind::unknownKey);
        std::string const text = e.what();
        CHECK(text.find("\"z\"") != std::string::npos);
        CHECK(text.find("\"a\"") != std::string::npos);
        CHECK(text.find("\"b\"") != std::string::npos);
    }
}

TEST_CASE("unknown keys are logged with warn") {
    std::vector<std::string> lines;
    auto previous = setLogSink([&lines] (LogLevel, std::string_view message) { lines.emplace_back(message); });
    auto restore = detail::callAtEndOfScope([&] { setLogSink(previous); });

    auto plain = load<Plain>(Map { { "a", 1 }, { "extra", 2 } }, Config { .onUnknownKey = UnknownKeyAction::warn });

    CHECK(plain.a() == 1);
    REQUIRE(lines.size() == 1);
    CHECK(lines[0].find("Found 1 unknown keys") != std::string::npos);
    CHECK(lines[0].find("\"extra\"") != std::string::npos);
}

TEST_CASE("unknown keys are ignored by default") {
    CHECK(load<Plain>(Map { { "a", 1 }, { "zzz", 2 } }).a() == 1);
}

TEST_CASE("collect all errors") {
    try
    {
        load<Pair2>(Map { { "a", "x" } }, Config { .collectErrors = true });
        FAIL("expected an aggregate error");
    }
    catch (Error const& e)
    {
        CHECK(e.kind() == ErrorKind::aggregate);
        REQUIRE(e.errors().size() == 2);
        CHECK(e.errors()[0].kind() == ErrorKind::typeMismatch);
        CHECK(e.errors()[0].pathString() == "a");
        CHECK(e.errors()[1].kind() == ErrorKind::missingField);
        CHECK(e.errors()[1].record() == "Pair2");
    }
}

TEST_CASE("per-field overrides from the configuration") {
    Config config { .fields = { { "a", FieldOptions { .loadAliases = { "alpha" } } } } };
    CHECK(load<Plain>(Map { { "alpha", 4 } }, config).a() == 4);
    CHECK(dump(Plain { 4 }, config) == Value(Map { { "alpha", 4 } }));

    Config renamed { .fields = { { "a", FieldOptions { .dumpAlias = KeyPath("A") } } } };
    CHECK(dump(Plain { 4 }, renamed) == Value(Map { { "A", 4 } }));
    CHECK(dump(Plain { 4 }) == Value(Map { { "a", 4 } }));
}

TEST_CASE("per-field overrides apply to the called record only") {
    Config config { .fields = { { "a", FieldOptions { .loadAliases = { "alpha" } } } } };

    auto loaded = load<Nested>(Map { { "inner", Map { { "a", 1 } } }, { "count", 2 } }, config);
    CHECK(loaded.inner().a() == 1);
}

TEST_CASE("a tag given at the call site") {
    Config tagged { .tag = "P", .onUnknownKey = UnknownKeyAction::raise };
    CHECK(compile<Plain>(tagged)->config().tag == "P");
    CHECK(load<Plain>(Map { { "__tag__", "P" }, { "a", 1 } }, tagged).a() == 1);

    Config untagged { .onUnknownKey = UnknownKeyAction::raise };
    CHECK_FALSE(compile<Plain>(untagged)->config().tag.has_value());
    CHECK_THROWS_AS(load<Plain>(Map { { "__tag__", "P" }, { "a", 1 } }, untagged), Error);
}

TEST_CASE("a stray tag key is an unknown key") {
    try
    {
        load<Strict>(Map { { "a", 1 }, { "__tag__", "x" } });
        FAIL("expected an unknown key error");
    }
    catch (Error const& e)
    {
        CHECK(e.kind() == ErrorKind::unknownKey);
    }
}

TEST_CASE("propagation disabled at the call site") {
    Value snakeInside = Map { { "innerValue", Map { { "item_count", 3 } } } };
    Value camelInside = Map { { "innerValue", Map { { "itemCount", 3 } } } };

    Config propagating { .keyCasingLoad = KeyCase::camel };
    CHECK(load<CamelOuter>(camelInside, propagating).innerValue().itemCount() == 3);

    Config local { .keyCasingLoad = KeyCase::camel, .recursive = false };
    CHECK(load<CamelOuter>(snakeInside, local).innerValue().itemCount() == 3);
    CHECK_THROWS_AS(load<CamelOuter>(camelInside, local), Error);
}

TEST_CASE("configuration propagates to nested records") {
    auto loaded = load<Propagating>(Map { { "nested", Map { { "Inner", Map { { "a", 1 } } }, { "count", 2 } } } });
    CHECK(loaded.nested().inner().a() == 1);
}

TEST_CASE("propagation can be disabled") {
    Value input = Map { { "innerValue", Map { { "item_count", 3 } } } };
    CHECK(load<NonPropagating>(input).innerValue().itemCount() == 3);

    Value camelInside = Map { { "innerValue", Map { { "itemCount", 3 } } } };
    CHECK_THROWS_AS(load<NonPropagating>(camelInside), Error);
}

TEST_CASE("non map input") {
    CHECK_THROWS_AS(load<Point>(Value(Sequence { 1, 2 })), Error);
}

} // TEST_SUITE("Records")

//=============================================================================
// Containers, scalars and enumerations
//=============================================================================

TEST_SUITE("Containers") {

TEST_CASE("every container kind") {
    Value input = Map {
        { "numbers", Sequence { 1, 2, 3 } },
        { "unique", Sequence { 3, 1, 3 } },
        { "names", Map { { "1", "one" }, { "2", "two" } } },
        { "pair", Sequence { 1, "a" } },
        { "triple", Sequence { 7, 8, 9 } },
        { "blob", "aGVsbG8=" },
        { "color", "g" }
    };

    auto c = load<Containers>(input);
    CHECK(c.numbers() == std::vector<int> { 1, 2, 3 });
    CHECK(c.unique() == std::set<int> { 1, 3 });
    CHECK(c.names().at(2) == "two");
    CHECK(std::get<1>(c.pair()) == "a");
    CHECK(c.triple()[2] == 9);
    CHECK(c.blob().size() == 5);
    CHECK(c.color() == Color::green);

    auto dumped = dump(c);
    auto const& map = dumped.as<Map>();
    CHECK(*map.find("unique") == Value(Sequence { 1, 3 }));
    CHECK(*map.find("names") == Value(Map { { "1", "one" }, { "2", "two" } }));
    CHECK(*map.find("blob") == Value("aGVsbG8="));
    CHECK(*map.find("color") == Value("g"));
}

TEST_CASE("element errors carry their index") {
    try
    {
        load<std::vector<int>>(Value(Sequence { 1, "x" }));
        FAIL("expected a type mismatch");
    }
    catch (Error const& e)
    {
        CHECK(e.pathString() == "[1]");
    }
}

TEST_CASE("fixed tuples check their length") {
    try
    {
        load<std::tuple<int, std::string>>(Value(Sequence { 1 }));
        FAIL("expected a length mismatch");
    }
    catch (Error const& e)
    {
        CHECK(e.kind() == ErrorKind::lengthMismatch);
    }
}

TEST_CASE("integer ranges") {
    CHECK(load<std::uint8_t>(Value(255)) == 255);
    CHECK_THROWS_AS(load<std::uint8_t>(Value(256)), Error);
    CHECK_THROWS_AS(dump(std::numeric_limits<std::uint64_t>::max()), Error);
}

TEST_CASE("enumerations by value or name") {
    CHECK(load<Color>(Value("b")) == Color::blue);
    CHECK_THROWS_AS(load<Color>(Value("blue")), Error);

    Config byName { .enumMatch = EnumMatch::byName };
    CHECK(load<Color>(Value("blue"), byName) == Color::blue);
    CHECK(dump(Color::red, byName) == Value("red"));
}

TEST_CASE("maps keyed by enumerations") {
    std::map<Level, std::string> const levels { { Level::low, "l" }, { Level::high, "h" } };

    auto dumped = dump(levels);
    CHECK(dumped == Value(Map { { "1", "l" }, { "2", "h" } }));
    CHECK(load<std::map<Level, std::string>>(dumped) == levels);

    std::map<Color, int> const colors { { Color::red, 1 } };
    CHECK(load<std::map<Color, int>>(dump(colors)) == colors);

    CHECK(load<Level>(Value(2)) == Level::high);
    CHECK_THROWS_AS(load<Level>(Value("2")), Error);
    CHECK_THROWS_AS(load<std::map<Level, std::string>>(Value(Map { { "3", "x" } })), Error);
}

TEST_CASE("named tuples positional or keyed") {
    auto positional = load<WithCoordinates>(Map { { "coordinates", Sequence { 1, "r" } } });
    CHECK(positional.coordinates().left == 1);
    CHECK(positional.coordinates().right == "r");

    Config asMap { .namedTupleAsMap = true };
    auto keyed = load<WithCoordinates>(Map { { "coordinates", Map { { "left", 2 }, { "right", "s" } } } }, asMap);
    CHECK(keyed.coordinates().left == 2);
    CHECK(dump(keyed, asMap) == Value(Map { { "coordinates", Map { { "left", 2 }, { "right", "s" } } } }));
}

TEST_CASE("values pass through") {
    Value any = Map { { "free", Sequence { 1, "form" } } };
    CHECK(load<Value>(any) == any);
}

TEST_CASE("date and time fields") {
    Value input = Map { { "at", "2024-03-01T10:30:00Z" }, { "day", "05/04/2024" }, { "length", "01:30:00" } };
    auto meeting = load<Meeting>(input);

    CHECK(meeting.length() == 5400s);
    CHECK(meeting.day() == std::chrono::year(2024) / std::chrono::April / 5);

    CHECK(dump(meeting) == Value(Map { { "at", "2024-03-01T10:30:00Z" }, { "day", "2024-04-05" }, { "length", 5400 } }));

    auto timestamps = dump(meeting, Config { .dateTimeOutput = DateTimeOutput::timestamp });
    CHECK(*timestamps.as<Map>().find("at") == Value(1709289000));
}

TEST_CASE("time of day fields") {
    auto alarm = load<Alarm>(Map { { "ring", "06:45:00.25" } });
    CHECK(alarm.ring().to_duration() == 6h + 45min + 250ms);
    CHECK(dump(alarm) == Value(Map { { "ring", "06:45:00.250000" } }));

    try
    {
        load<Alarm>(Map { { "ring", "25:00" } });
        FAIL("expected a pattern parse failure");
    }
    catch (Error const& e)
    {
        CHECK(e.kind() == ErrorKind::patternParse);
        CHECK(e.pathString() == "ring");
    }
}

} // TEST_SUITE("Containers")

//=============================================================================
// Sum types
//=============================================================================

TEST_SUITE("Unions") {

TEST_CASE("tagged dispatch") {
    auto pet = load<Pet>(Map { { "animal", Map { { "t", "B" }, { "name", "rex" } } } });

    REQUIRE(std::holds_alternative<Dog>(pet.animal()));
    CHECK(std::get<Dog>(pet.animal()).name() == "rex");
    CHECK(std::get<Dog>(pet.animal()).good());
}

TEST_CASE("the tag is not passed on to the alternative") {
    Config strict { .onUnknownKey = UnknownKeyAction::raise };
    auto pet = load<Pet>(Map { { "animal", Map { { "t", "A" }, { "name", "tom" } } } }, strict);
    CHECK(std::get<Cat>(pet.animal()).name() == "tom");

    CHECK(load<Cat>(Map { { "__tag__", "A" }, { "name", "tom" } }, strict).name() == "tom");
}

TEST_CASE("unknown tags name the known ones") {
    try
    {
        load<Pet>(Map { { "animal", Map { { "t", "C" }, { "name", "x" } } } });
        FAIL("expected a tag dispatch failure");
    }
    catch (Error const& e)
    {
        CHECK(e.kind() == ErrorKind::tagDispatch);
        CHECK(e.pathString() == "animal");

        std::string const text = e.what();
        CHECK(text.find("[\"A\", \"B\"]") != std::string::npos);
    }
}

TEST_CASE("dump puts the tag first") {
    Pet pet;
    pet.animal = std::variant<Cat, Dog>(Cat { std::string("tom") });

    auto dumped = dump(pet);
    auto const& animal = dumped.as<Map>().find("animal")->as<Map>();

    CHECK(animal.begin()->key == Value("t"));
    CHECK(*animal.find("t") == Value("A"));
    CHECK(load<Pet>(dumped).animal().index() == 0);
}

TEST_CASE("automatic tags use the type name") {
    Drawing drawing;
    drawing.shape = std::variant<Circle, Square>(Square { 2.0 });

    auto dumped = dump(drawing);
    CHECK(*dumped.as<Map>().find("shape")->as<Map>().find("__tag__") == Value("Square"));

    auto loaded = load<Drawing>(dumped);
    CHECK(std::get<Square>(loaded.shape()).side() == doctest::Approx(2.0));
}

TEST_CASE("untagged alternatives prefer an exact scalar match") {
    using Scalar = std::variant<int, std::string, double>;

    CHECK(load<Scalar>(Value("5")).index() == 1);
    CHECK(load<Scalar>(Value(5)).index() == 0);
    CHECK(load<Scalar>(Value(2.5)).index() == 2);
}

TEST_CASE("untagged records are tried in order") {
    using Shape = std::variant<Circle, Square>;

    CHECK(load<Shape>(Value(Map { { "side", 1 } })).index() == 1);
    CHECK(load<Shape>(Value(Map { { "radius", 1 } })).index() == 0);
    CHECK_THROWS_AS(load<Shape>(Value(Map { { "other", 1 } })), Error);
}

TEST_CASE("unsafe dispatch goes to the first record") {
    using Shape = std::variant<Circle, Square>;
    CHECK_THROWS_AS(load<Shape>(Value(Map { { "side", 1 } }), Config { .unsafeUnionDispatch = true }), Error);
}

TEST_CASE("null selects monostate") {
    using MaybeInt = std::variant<std::monostate, int>;

    CHECK(load<MaybeInt>(Value()).index() == 0);
    CHECK(load<MaybeInt>(Value(3)).index() == 1);
    CHECK(dump(MaybeInt {}) == Value());
}

TEST_CASE("duplicate tags are rejected") {
    CHECK_THROWS_AS(compile<Twins>(), Error);
}

} // TEST_SUITE("Unions")

//=============================================================================
// Recursive types
//=============================================================================

TEST_SUITE("Recursion") {

TEST_CASE("self reference") {
    auto node = load<Node>(Map { { "next", Map { { "next", nullptr } } } });

    REQUIRE(node.next() != nullptr);
    CHECK(node.next()->next() == nullptr);
    CHECK(dump(node) == Value(Map { { "next", Map { { "next", nullptr } } } }));
}

TEST_CASE("recursion through a container") {
    Value input = Map { { "value", 1 }, { "children", Sequence { Map { { "value", 2 } }, Map { { "value", 3 }, { "children", Sequence {} } } } } };
    auto tree = load<Tree>(input);

    REQUIRE(tree.children().size() == 2);
    CHECK(tree.children()[1].value() == 3);
    CHECK(tree.children()[0].children().empty());
}

TEST_CASE("a recursive type compiles once") {
    RoutineCache cache;
    auto routine = compile<Node>({}, cache);

    Node node;
    routine->load(Value(Map { { "next", Map { { "next", Map {} } } } }), &node);

    CHECK(cache.compilations() == 1);
    CHECK(node.next()->next() != nullptr);
}

} // TEST_SUITE("Recursion")

//=============================================================================
// Routine cache
//=============================================================================

TEST_SUITE("Cache") {

TEST_CASE("routines are reused per configuration") {
    RoutineCache cache;

    auto a = compile<Point>({}, cache);
    auto b = compile<Point>({}, cache);
    auto c = compile<Point>(Config { .keyCasingLoad = KeyCase::camel }, cache);

    CHECK(a == b);
    CHECK(a != c);
    CHECK(cache.size() == 2);
}

TEST_CASE("nested records are compiled once") {
    RoutineCache cache;
    compile<Line>({}, cache);

    CHECK(cache.size() == 2);
    CHECK(cache.find(metaTypeOf<Point>(), {}) != nullptr);
}

TEST_CASE("call site field options get their own routine") {
    RoutineCache cache;
    auto plain = compile<Line>({}, cache);
    auto renamed = compile<Line>(Config { .fields = { { "start", FieldOptions { .dumpAlias = KeyPath("from") } } } }, cache);

    CHECK(plain != renamed);
    CHECK(renamed->config().fieldOptions("start") != nullptr);
    CHECK(cache.size() == 3);
}

TEST_CASE("concurrent compilation yields one routine") {
    RoutineCache cache;
    std::vector<std::shared_ptr<Routine const>> routines(8);
    std::vector<std::thread> threads;

    for (std::size_t i = 0; i < routines.size(); ++i)
        threads.emplace_back([&cache, &routines, i] { routines[i] = compile<Fresh1>({}, cache); });

    for (auto& thread : threads)
        thread.join();

    for (auto const& routine : routines)
        CHECK(routine == routines.front());

    CHECK(cache.find(metaTypeOf<Fresh1>(), {}) == routines.front());
}

TEST_CASE("listing and symbols") {
    RoutineCache cache;
    auto routine = compile<Containers>({}, cache);

    REQUIRE(routine->listing().size() == 7);
    CHECK(routine->listing()[0].starts_with("f0_v0 numbers"));
    CHECK(routine->symbols().contains("enum_f6_v0"));
    CHECK(routine->symbols().find<std::vector<EnumerationMeta::Entry>>("enum_f6_v0")->size() == 3);
    CHECK(routine->config().fingerprint() == Config {}.fingerprint());
}

} // TEST_SUITE("Cache")

//=============================================================================
// Extensions
//=============================================================================

TEST_SUITE("Extensions") {

TEST_CASE("types without handler are unsupported") {
    try
    {
        compile<WithOpaque>();
        FAIL("expected an unsupported type");
    }
    catch (Error const& e)
    {
        CHECK(e.kind() == ErrorKind::unsupportedType);
        CHECK(e.pathString() == "opaque");
        CHECK(e.record() == "WithOpaque");
    }
}

TEST_CASE("registered conversions") {
    registerType<Version>();
    registerType<Money>([] (Value const& v) { return Money(loadInteger(v) * 100); },
                        [] (Money const& m) { return Value(m.value() / 100); });
    registerTypeHooks<Ticket>(
        [] (TypeDescriptor const& descriptor, CompileContext&)
        {
            return Fragment { descriptor.binding(), [] (Value const& v, void* t) { static_cast<Ticket*>(t)->id = static_cast<int>(loadInteger(v)); }, {} };
        },
        [] (TypeDescriptor const& descriptor, CompileContext&)
        {
            return Fragment { descriptor.binding(), {}, [] (void const* s) { return Value(static_cast<Ticket const*>(s)->id); } };
        });

    auto release = load<Release>(Map { { "version", "1.2" }, { "price", 5 }, { "ticket", 9 } });

    CHECK(release.version().str() == "1.2");
    CHECK(release.price().value() == 500);
    CHECK(release.ticket().id == 9);
    CHECK(dump(release) == Value(Map { { "version", "1.2" }, { "price", 5 }, { "ticket", 9 } }));

    CHECK(ExtensionRegistry::global().contains(typeid(Money)));
}

TEST_CASE("failing conversions become type mismatches") {
    registerType<Money>([] (Value const&) -> Money { throw std::invalid_argument("no currency"); }, {});

    RoutineCache cache;
    auto routine = compile<Money>({}, cache);
    Money money;

    try
    {
        routine->load(Value("x"), &money);
        FAIL("expected a type mismatch");
    }
    catch (Error const& e)
    {
        CHECK(e.kind() == ErrorKind::typeMismatch);
        CHECK(std::string(e.what()).find("no currency") != std::string::npos);
    }

    CHECK(unregisterType<Money>());
}

} // TEST_SUITE("Extensions")

//=============================================================================
// Schema validation
//=============================================================================

TEST_SUITE("Schema validation") {

TEST_CASE("every problem is reported") {
    auto errors = validateSchema<Broken>();

    REQUIRE(errors.size() == 3);
    CHECK(errors[0].kind() == ErrorKind::unsupportedType);
    CHECK(errors[0].pathString() == "opaque");
    CHECK(errors[1].kind() == ErrorKind::descriptorResolution);
    CHECK(errors[1].pathString() == "year");
    CHECK(errors[2].pathString() == "bad");
    CHECK(errors[2].record() == "Broken");
}

TEST_CASE("valid schemas report nothing") {
    CHECK(validateSchema<Line>().empty());
    CHECK(validateSchema<Node>().empty());
    CHECK(validateSchema<Pet>().empty());
}

TEST_CASE("compilation stops at the first problem") {
    CHECK_THROWS_AS(compile<Broken>(), Error);
}

} // TEST_SUITE("Schema validation")
