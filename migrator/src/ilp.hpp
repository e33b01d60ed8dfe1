#pragma once

#include "migration_record.hpp"
#include <string>
#include <vector>

// InfluxDB line protocol as accepted by QuestDB:
// table,tag=v,... field=v,... <timestamp ns>
namespace ilp {
    std::string escape_tag(const std::string& value);
    std::string format_line(const std::string& table, const MigrationRecord& record);
    std::string format_lines(const std::string& table, const std::vector<MigrationRecord>& records);
}
