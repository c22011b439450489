#include <complex>
#include <iostream>
#include <memory>
#include "marshal.hpp"

// Example usage
using namespace marshal;

struct Point
{
    Field<float, "x">      x;
    Field<float, "y">      y = 0.0f;

    friend bool operator==(Point const& a, Point const& b) noexcept
    {
        return a.x() == b.x() && a.y() == b.y();
    }
};

struct Line
{
    Field<Point, "start">       start;
    Field<Point, "finish">      finish;

    friend bool operator==(Line const& a, Line const& b) = default;
};

struct Circle
{
    Field<Point,  "center">     center;
    Field<double, "radius">     radius;

    static Config marshalConfig() { return { .tag = "circle" }; }
};

struct Polygon
{
    Field<std::vector<Point>, "corners"> corners;

    static Config marshalConfig() { return { .tag = "polygon" }; }
};

struct State
{
    Field<Annotated<std::string, alias<"title">>,        "document_name"> documentName;
    Field<Line,                                           "line">          line;
    Field<std::map<std::string, Line>,                    "paths">         paths;
    Field<std::vector<std::variant<Circle, Polygon>>,     "shapes">        shapes;
    Field<Annotated<Instant, pattern<"%d.%m.%Y %H:%M">>,  "modified">      modified;
    Field<Annotated<std::optional<int>, skip_if_null>,    "revision">      revision;

    static Config marshalConfig()
    {
        return { .keyCasingLoad = KeyCase::automatic, .keyCasingDump = KeyCase::camel, .onUnknownKey = UnknownKeyAction::warn };
    }
};

struct Unsupported
{
    Field<std::string,          "label">      label;
    Field<std::complex<double>, "impedance">  impedance;
};

struct Application : std::enable_shared_from_this<Application>
{
    Application() {}

    void run()
    {
        Value input = Map
        {
            { "title", "drawing" },
            { "line", Map { { "start", Map { { "x", 1.1 }, { "y", 2.2 } } }, { "finish", Map { { "x", "3.5" } } } } },
            { "paths", Map { { "fabian", Map { { "start", Map { { "x", 0 } } }, { "finish", Map { { "x", 1 } } } } } } },
            { "shapes", Sequence
                {
                    Map { { "__tag__", "circle" }, { "center", Map { { "x", 0 }, { "y", 0 } } }, { "radius", 2 } },
                    Map { { "__tag__", "polygon" }, { "corners", Sequence { Map { { "x", 1 } }, Map { { "x", 2 } } } } }
                }
            },
            { "modified", "05.04.2024 13:45" },
            { "colour", "blue" }
        };

        auto state = load<State>(input);

        std::cout << "document \"" << state.documentName() << "\" with " << state.shapes().size() << " shapes" << std::endl;
        std::cout << "line finishes at x = " << state.line().finish().x() << std::endl;

        for (auto const& shape : state.shapes())
        {
            std::visit(detail::multilambda
            {
                [] (Circle const& circle)   { std::cout << "  circle of radius " << circle.radius() << std::endl; },
                [] (Polygon const& polygon) { std::cout << "  polygon with " << polygon.corners().size() << " corners" << std::endl; }
            }, shape);
        }

        state.revision = std::optional<int>(3);
        std::cout << "dumped: " << dump(state) << std::endl;

        try
        {
            load<Line>(Map { { "start", Map { { "x", "left" } } }, { "finish", Map { { "x", 1 } } } });
        }
        catch (Error const& e)
        {
            std::cout << "error: " << e.what() << std::endl;
        }
    }
};

void routineExamples()
{
    std::cout << "\n=== Routine Examples ===\n\n";

    // 1. Inspect a compiled routine
    std::cout << "--- compile<State>() listing ---\n";
    auto const routine = compile<State>();
    for (auto const& line : routine->listing())
        std::cout << "  " << line << "\n";

    // 2. Routines are cached per configuration
    std::cout << "\n--- Routine cache ---\n";
    std::cout << "  same routine on second compile: " << (compile<State>() == routine) << "\n";
    std::cout << "  routines in the global cache: " << RoutineCache::global().size() << "\n";

    // 3. Field metadata without an instance
    std::cout << "\n--- metaTypeOf<Line>() fields ---\n";
    for (auto const& field : metaTypeOf<Line>().fields())
        std::cout << "  " << field.fieldname << " (" << toString(field.metaType().kind()) << ")\n";

    // 4. Problems are reported up front
    std::cout << "\n--- validateSchema<Unsupported>() ---\n";
    for (auto const& error : validateSchema<Unsupported>())
        std::cout << "  " << error.what() << "\n";
}

int main()
{
    auto app = std::make_shared<Application>();
    app->run();

    routineExamples();

    return 0;
}
