#include <query/route.hpp>

namespace query {
    endpoint::endpoint(std::string_view name, std::string_view description) :
        name(name),
        description(description)
    {}
}
