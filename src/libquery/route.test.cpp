#include <query/query>

#include <gtest/gtest.h>

using namespace std::literals;

namespace {
    // A combinator that only supports documentation.
    struct note {
        std::string text;

        template <typename Next>
        auto document(query::docs::action&& action, Next&& next) const
            -> query::docs::action
        {
            action.description = text;
            return std::forward<Next>(next)(std::move(action));
        }
    };

    // A required parameter: decode failure leaves the handler uncalled.
    struct required {
        std::string name;

        using server_type = int;
        using client_type = int;

        template <typename Next>
        auto serve(const query::parsed_query& parsed, Next&& next) const
            -> decltype(auto)
        {
            const auto result = parsed.find(name);
            const auto* const text = std::get_if<std::string_view>(&result);

            if (!text) throw query::error("Missing required '{}'", name);

            const auto value = query::converter<int>::decode(*text);
            if (!value) throw query::error("Invalid value for '{}'", name);

            return std::forward<Next>(next)(*value);
        }

        template <typename Next>
        auto client(query::request&& req, int value, Next&& next) const
            -> query::request
        {
            req.append(name, query::converter<int>::encode(value));
            return std::forward<Next>(next)(std::move(req));
        }

        template <typename Next>
        auto document(query::docs::action&& action, Next&& next) const
            -> query::docs::action
        {
            return std::forward<Next>(next)(
                std::move(action).register_param(query::docs::param {
                    .name = name,
                    .kind = query::docs::param_kind::single,
                    .description = "required"
                })
            );
        }
    };
}

TEST(Route, RejectsEmptyName) {
    EXPECT_THROW(query::param<int>(""), query::error);
    EXPECT_THROW(query::params<int>(""), query::error);
    EXPECT_THROW(query::flag(""), query::error);
}

TEST(Route, RejectsReservedCharacters) {
    for (const auto name : {"a&b", "a=b", "a?", "#a"}) {
        EXPECT_THROW(query::param<int> {name}, query::error) << name;
    }

    try {
        query::flag("x=1");
        FAIL() << "Expected query::error";
    }
    catch (const query::error& ex) {
        EXPECT_STREQ(
            "Query parameter name 'x=1' contains reserved character '='",
            ex.what()
        );
    }
}

TEST(Route, AcceptsArrayStyleName) {
    EXPECT_NO_THROW(query::params<int>("ids[]"));
}

TEST(Route, Concepts) {
    static_assert(query::combinator<query::param<int>>);
    static_assert(query::combinator<query::params<std::string>>);
    static_assert(query::combinator<query::flag>);
    static_assert(query::combinator<note>);
    static_assert(query::docs_interpretable<note>);
    static_assert(!query::server_interpretable<note>);
    static_assert(!query::client_interpretable<note>);
    static_assert(!query::combinator<int>);

    const auto chain = query::flag("a") >> query::param<int>("b");
    static_assert(!query::route<decltype(chain)>);

    const auto route = chain >> query::endpoint("end");
    static_assert(query::route<decltype(route)>);
    static_assert(query::route<query::endpoint>);

    static_assert(std::same_as<
        query::server_types_t<decltype(route)>,
        std::tuple<bool, std::optional<int>>
    >);
}

TEST(Route, EndpointOf) {
    const auto route =
        query::flag("a") >>
        query::flag("b") >>
        query::endpoint("letters", "Two flags");

    EXPECT_EQ("letters", query::endpoint_of(route).name);
    EXPECT_EQ("Two flags", query::endpoint_of(route).description);
}

TEST(Route, ChainsCanBeExtended) {
    const auto base = query::param<int>("page") >> query::param<int>("limit");
    const auto route = base >> query::flag("all") >> query::endpoint("list");

    const auto action = query::document(route);

    ASSERT_EQ(3, action.params.size());
    EXPECT_EQ("page", action.params[0].name);
    EXPECT_EQ("limit", action.params[1].name);
    EXPECT_EQ("all", action.params[2].name);
}

TEST(Route, DocsOnlyCombinator) {
    const auto route =
        query::flag("all") >>
        note {.text = "Lists everything"} >>
        query::endpoint("list");

    const auto action = query::document(route);

    EXPECT_EQ(1, action.params.size());
    EXPECT_EQ("Lists everything", action.description);
}

TEST(Route, NewCombinatorKind) {
    const auto route =
        required {.name = "id"} >>
        query::flag("verbose") >>
        query::endpoint("show");

    const auto handler = [](int id, bool verbose) {
        return fmt::format("{}:{}", id, verbose);
    };

    EXPECT_EQ("7:true", query::serve(route, "verbose&id=7", handler));
    EXPECT_THROW(query::serve(route, "id=x", handler), query::error);
    EXPECT_THROW(query::serve(route, "verbose", handler), query::error);

    const auto req = query::build(
        route,
        query::request("GET", "https://example.com/items"),
        7,
        true
    );

    EXPECT_EQ("id=7&verbose", req.query_string());

    const auto action = query::document(route);

    ASSERT_EQ(2, action.params.size());
    EXPECT_EQ("required", action.params[0].description);
}
