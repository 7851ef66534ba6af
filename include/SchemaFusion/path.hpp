#pragma once

#include <cstddef>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace SchemaFusion {
namespace path {

struct PathElement {
    std::size_t array_index = std::numeric_limits<std::size_t>::max();   // sequences
    std::string field_name;  // record fields and mapping keys

    PathElement() = default;

    // For `{index}`
    PathElement(std::size_t index)
        : array_index(index)
    {}

    // For `{max, key}`
    PathElement(std::size_t index, std::string_view key)
        : array_index(index)
        , field_name(key)
    {}

    bool isIndex() const noexcept {
        return array_index != std::numeric_limits<std::size_t>::max();
    }

    bool operator==(const PathElement & other) const {
        return array_index == other.array_index && field_name == other.field_name;
    }
};

struct Path {
    using PathElementT = PathElement;

    std::size_t currentLength = 0;
    std::vector<PathElementT> storage;

    Path() = default;

    template <class ... PathElems>
        requires (sizeof...(PathElems) > 0 && (!std::is_same_v<std::remove_cvref_t<PathElems>, Path> && ...))
    Path(PathElems ... args) {
        auto toPathElement = []<class ArgT>(ArgT arg) {
            if constexpr (std::is_convertible_v<ArgT, std::string_view>) {
                return PathElementT {
                    std::numeric_limits<std::size_t>::max(),
                        std::string_view(arg)
                };
            } else if constexpr (std::is_convertible_v<ArgT, std::size_t>){
                return PathElementT {
                    static_cast<std::size_t>(arg)
                };
            } else {
                static_assert(!sizeof(arg), "Use integer or str-compatible segments in Path contruction");
            }
        };
        storage = std::vector<PathElementT> {toPathElement(args)...};
        currentLength = sizeof...(args);
    }

    void push_field(std::string_view key) {
        storage.emplace_back(std::numeric_limits<std::size_t>::max(), key);
        currentLength ++;
    }

    void push_index(std::size_t index) {
        storage.emplace_back(index);
        currentLength ++;
    }

    void pop() {
        storage.pop_back();
        currentLength --;
    }

    // $.servers[1].host
    std::string toString() const {
        std::string s = "$";
        for(std::size_t i = 0; i < currentLength; i ++) {
            if(storage[i].isIndex()) {
                s += "[" + std::to_string(storage[i].array_index) + "]";
            } else {
                s += "." + storage[i].field_name;
            }
        }
        return s;
    }

    bool operator==(const Path & other) const {
        return currentLength == other.currentLength && storage == other.storage;
    }
};

} // namespace path
} // namespace SchemaFusion
