#include "history/history.hpp"
#include "common/json_utils.hpp"

namespace coderun {
using namespace std;
using namespace nlohmann;

history::~history() {}

void to_json(json &j, const history_record &record) {
    j = {{"timestamp", record.timestamp},
         {"language", record.language},
         {"code", record.code},
         {"output", record.output},
         {"error", record.error},
         {"exit_code", record.exit_code},
         {"status", get_display_message(record.classification)}};
}

void from_json(const json &j, history_record &record) {
    record.timestamp = get_value<string>(j, "timestamp");
    record.language = get_value<string>(j, "language");
    record.code = get_value<string>(j, "code");
    record.output = get_value<string>(j, "output");
    record.error = get_value<string>(j, "error");
    record.exit_code = get_value<int>(j, "exit_code");

    string stat = get_value<string>(j, "status");
    for (int i = (int)status::SUCCESS; i <= (int)status::INTERNAL_FAILURE; ++i) {
        if (stat == get_display_message((status)i)) {
            record.classification = (status)i;
            return;
        }
    }
    throw build_invalid_argument(j, "status");
}

}  // namespace coderun
