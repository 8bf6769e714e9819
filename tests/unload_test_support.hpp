#ifndef RSBRIDGE_TESTS_UNLOAD_TEST_SUPPORT_HPP
#define RSBRIDGE_TESTS_UNLOAD_TEST_SUPPORT_HPP

#include <cstdio>
#include <memory>
#include <regex>
#include <string>
#include <vector>

#include "fake_warehouse.hpp"

namespace rsbridge {
namespace test {

/**
 * Make every UNLOAD executed against `state` leave `parts` (one file each)
 * and a _SUCCESS marker under the engine-side form of its TO location.
 */
inline void fake_unload_output(FakeWarehouseState& state,
                               std::shared_ptr<MemoryObjectStore> store,
                               std::vector<std::string> parts) {
    state.on_execute = [store, parts](const std::string& sql) {
        static const std::regex destination(R"(\) TO 's3://([^']+)')");
        std::smatch match;
        if (sql.rfind("UNLOAD ", 0) != 0 || !std::regex_search(sql, match, destination)) {
            return;
        }
        std::string directory = "s3n://" + match[1].str();
        for (size_t i = 0; i < parts.size(); ++i) {
            char name[32];
            std::snprintf(name, sizeof(name), "%04zu_part_00", i);
            store->put_file(directory + name, std::vector<uint8_t>(parts[i].begin(), parts[i].end()));
        }
        store->put_file(directory + "_SUCCESS", {});
    };
}

}  // namespace test
}  // namespace rsbridge

#endif  // RSBRIDGE_TESTS_UNLOAD_TEST_SUPPORT_HPP
