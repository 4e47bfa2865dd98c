#pragma once

#include <istream>
#include <string>
#include <tuple>
#include <vector>

#include "event_log.hpp"
#include "ports/errors/errors.hpp"

namespace process_miner {

// Reads case_id,activity,timestamp,resource rows. Column order is free and
// extra columns are ignored.
class CsvLoader {
 public:
  static std::tuple<std::vector<Event>, error> Load(const std::string& csvFile);

  // @p source names the input in messages.
  static std::tuple<std::vector<Event>, error> Parse(std::istream& in,
                                                     const std::string& source);

 private:
  struct ColumnLayout {
    size_t columns = 0;
    size_t caseId = 0;
    size_t activity = 0;
    size_t timestamp = 0;
    size_t resource = 0;
  };

  static std::tuple<ColumnLayout, error> parseHeader(const std::string& line);
  static std::vector<std::string> splitRow(const std::string& line);
};

}  // namespace process_miner
