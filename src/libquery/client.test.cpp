#include <query/query>

#include <gtest/gtest.h>

using namespace std::literals;

namespace {
    const auto books =
        query::param<std::string>("author") >>
        query::params<int>("year") >>
        query::flag("published") >>
        query::endpoint("list books");
}

class ClientTest : public testing::Test {
protected:
    query::client client = query::client("https://example.com/books");
};

TEST_F(ClientTest, AppendsInRouteOrder) {
    const auto req = client.request(
        books,
        "asimov"s,
        std::vector<int> {1951, 1953},
        true
    );

    EXPECT_EQ("GET", req.method);
    EXPECT_EQ(
        "author=asimov&year=1951&year=1953&published",
        req.query_string()
    );

    EXPECT_EQ(
        "https://example.com/books"
        "?author=asimov&year=1951&year=1953&published"sv,
        std::string_view(req.url.string())
    );
}

TEST_F(ClientTest, NoArgumentsAddNothing) {
    const auto req = client.request(
        books,
        std::nullopt,
        std::vector<int>(),
        false
    );

    EXPECT_EQ("", req.query_string());
    EXPECT_FALSE(req.url.query().has_value());
    EXPECT_EQ(
        "https://example.com/books"sv,
        std::string_view(req.url.string())
    );
}

TEST_F(ClientTest, DoesNotModifyBaseUrl) {
    const auto req = client.request(books, "clarke"s, std::vector<int>(), true);

    EXPECT_EQ("author=clarke&published", req.query_string());
    EXPECT_FALSE(client.url().query().has_value());
}

TEST_F(ClientTest, EscapesValues) {
    const auto req = client.request(
        books,
        "tom & jerry"s,
        std::vector<int>(),
        false
    );

    EXPECT_EQ("author=tom+%26+jerry", req.query_string());
}

TEST_F(ClientTest, EmptyValue) {
    const auto req = client.request(
        books,
        ""s,
        std::vector<int>(),
        false
    );

    EXPECT_EQ("author=", req.query_string());
}

TEST_F(ClientTest, ServerDecodesClientRequest) {
    const auto req = client.request(
        books,
        "heinlein"s,
        std::vector<int> {1959, 1961},
        true
    );

    const auto matched = query::serve(
        books,
        req.query_string(),
        [](
            std::optional<std::string> author,
            std::vector<int> years,
            bool published
        ) {
            return
                author == "heinlein" &&
                years == std::vector<int> {1959, 1961} &&
                published;
        }
    );

    EXPECT_TRUE(matched);
}

TEST(Client, ArgumentsAreChecked) {
    using route = decltype(books);

    static_assert(query::arguments_for<
        route,
        std::string,
        std::vector<int>,
        bool
    >);

    static_assert(query::arguments_for<
        route,
        std::nullopt_t,
        std::vector<int>&,
        bool
    >);

    static_assert(!query::arguments_for<route, std::string, bool>);
    static_assert(!query::arguments_for<route, int, std::vector<int>, bool>);
}

TEST(Client, BuildOnExistingRequest) {
    const auto route = query::flag("verbose") >> query::endpoint("status");

    const auto req = query::build(
        route,
        query::request("HEAD", "https://example.com/status?format=json"),
        true
    );

    EXPECT_EQ("HEAD", req.method);
    EXPECT_EQ("format=json&verbose", req.query_string());
}

TEST(Client, RequestWithoutHost) {
    auto req = query::request();

    EXPECT_NO_THROW(req.append("page", "2"));
    EXPECT_NO_THROW(req.append("all", std::nullopt));
    EXPECT_EQ("page=2&all", req.query_string());
}

TEST(Client, RequestOwnsMethod) {
    auto req = query::request(
        std::string("POST"),
        "https://example.com/books"
    );

    req.append("page", "2");

    EXPECT_EQ("POST", req.method);
    EXPECT_EQ("page=2", req.query_string());
}
