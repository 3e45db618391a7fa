#include <public/atomic_file.hpp>
#include <public/campaign_store.hpp>
#include <public/errors.hpp>
#include <public/logging.hpp>

#include "private/csv.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>

#include <boost/filesystem.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace fs = boost::filesystem;

namespace basil {

namespace {

const char kStateMagic[] = "BASIL-OPTSTATE 1";

bool parse_number(const std::string &text, double &out) {
  if (text.empty()) {
    return false;
  }
  char *end = nullptr;
  errno = 0;
  double v = std::strtod(text.c_str(), &end);
  if (errno == ERANGE || end != text.c_str() + text.size()) {
    return false;
  }
  out = v;
  return true;
}

long long parse_integer(const std::string &text, const std::string &what) {
  char *end = nullptr;
  long long v = std::strtoll(text.c_str(), &end, 10);
  if (text.empty() || end != text.c_str() + text.size()) {
    throw StorageError("Malformed " + what + ": '" + text + "'");
  }
  return v;
}

ParameterValue parse_cell(const CampaignConfig &config,
                          const std::string &column, const std::string &text) {
  double number = 0.0;
  const Parameter *p = config.parameters().find(column);
  if (p) {
    switch (p->kind) {
    case ParameterKind::Categorical:
    case ParameterKind::Chemistry:
      return ParameterValue(text);
    case ParameterKind::Fixed:
      if (p->fixed_value.is_text()) {
        return ParameterValue(text);
      }
      break;
    case ParameterKind::Continuous:
    case ParameterKind::Discrete:
      break;
    }
  }
  // Columns of parameters removed by later edits fall through here too.
  if (parse_number(text, number)) {
    return ParameterValue(number);
  }
  return ParameterValue(text);
}

std::string format_double(double v) { return ParameterValue(v).to_string(); }

size_t column_index(const std::vector<std::string> &header,
                    const std::string &name, const fs::path &file) {
  auto it = std::find(header.begin(), header.end(), name);
  if (it == header.end()) {
    throw StorageError("Batch file " + file.string() + " lacks column '" +
                       name + "'");
  }
  return static_cast<size_t>(std::distance(header.begin(), it));
}

struct ParsedBatch {
  RunBatch batch;
  std::vector<RunResult> results;
};

ParsedBatch parse_batch_file(const CampaignConfig &config,
                             const fs::path &file) {
  std::vector<std::vector<std::string>> table;
  try {
    table = detail::parse_csv(read_file(file));
  } catch (const std::runtime_error &e) {
    if (dynamic_cast<const StorageError *>(&e)) {
      throw;
    }
    throw StorageError("Malformed batch file " + file.string() + ": " +
                       e.what());
  }
  if (table.size() < 2) {
    throw StorageError("Batch file " + file.string() + " has no rows");
  }

  const std::vector<std::string> &header = table.front();
  const size_t i_batch = column_index(header, "batch_id", file);
  const size_t i_row = column_index(header, "row_index", file);
  const size_t i_status = column_index(header, "status", file);
  const size_t i_source = column_index(header, "source", file);
  const size_t i_generated = column_index(header, "generated_at", file);
  const size_t i_ingested = column_index(header, "ingested_at", file);
  const size_t i_version = column_index(header, "config_version", file);
  if (!(i_row == i_batch + 1 && i_status == i_row + 1 && i_source > i_status)) {
    throw StorageError("Batch file " + file.string() +
                       " has an unexpected column order");
  }

  ParsedBatch parsed;
  std::map<size_t, Row> rows;
  for (size_t r = 1; r < table.size(); ++r) {
    const std::vector<std::string> &cells = table[r];
    if (cells.size() != header.size()) {
      throw StorageError("Batch file " + file.string() + " line " +
                         std::to_string(r + 1) + " has " +
                         std::to_string(cells.size()) + " fields, expected " +
                         std::to_string(header.size()));
    }
    try {
      if (r == 1) {
        parsed.batch.batch_id = cells[i_batch];
        parsed.batch.status = batch_status_from_string(cells[i_status]);
        parsed.batch.source = batch_source_from_string(cells[i_source]);
        parsed.batch.generated_at =
            parse_integer(cells[i_generated], "generated_at");
        parsed.batch.config_version =
            static_cast<int>(parse_integer(cells[i_version], "config_version"));
      }
    } catch (const ValidationError &e) {
      throw StorageError("Batch file " + file.string() + ": " + e.what());
    }
    if (cells[i_batch] != parsed.batch.batch_id) {
      throw StorageError("Batch file " + file.string() +
                         " mixes several batch ids");
    }
    const size_t row_index =
        static_cast<size_t>(parse_integer(cells[i_row], "row_index"));

    Row row;
    for (size_t c = 0; c < i_batch; ++c) {
      row[header[c]] = parse_cell(config, header[c], cells[c]);
    }
    if (!rows.emplace(row_index, std::move(row)).second) {
      throw StorageError("Batch file " + file.string() +
                         " repeats row_index " + std::to_string(row_index));
    }

    if (parsed.batch.status == BatchStatus::Completed) {
      RunResult result;
      result.batch_id = parsed.batch.batch_id;
      result.row_index = row_index;
      result.ingested_at = parse_integer(cells[i_ingested], "ingested_at");
      for (size_t c = i_status + 1; c < i_source; ++c) {
        double v = 0.0;
        if (!parse_number(cells[c], v)) {
          throw StorageError("Batch file " + file.string() +
                             " has a non-numeric value in column '" +
                             header[c] + "'");
        }
        result.values[header[c]] = v;
      }
      parsed.results.push_back(std::move(result));
    }
  }

  size_t expected = 0;
  for (auto &kv : rows) {
    if (kv.first != expected++) {
      throw StorageError("Batch file " + file.string() +
                         " has a gap in row_index");
    }
    parsed.batch.rows.push_back(std::move(kv.second));
  }
  return parsed;
}

} // namespace

CampaignLock::CampaignLock(const fs::path &lock_file) : _fd(-1) {
  try {
    fs::create_directories(lock_file.parent_path());
  } catch (const fs::filesystem_error &e) {
    throw StorageError(std::string("Cannot create campaign directory: ") +
                       e.what());
  }
  _fd = ::open(lock_file.c_str(), O_RDWR | O_CREAT, 0644);
  if (_fd == -1) {
    throw StorageError("Cannot open lock file " + lock_file.string() + ": " +
                       std::strerror(errno));
  }
  if (::flock(_fd, LOCK_EX | LOCK_NB) == -1) {
    int err = errno;
    ::close(_fd);
    _fd = -1;
    if (err == EWOULDBLOCK) {
      throw StorageError("Campaign at " + lock_file.parent_path().string() +
                         " is open in another session");
    }
    throw StorageError("Cannot lock " + lock_file.string() + ": " +
                       std::strerror(err));
  }
}

CampaignLock::~CampaignLock() {
  if (_fd != -1) {
    ::flock(_fd, LOCK_UN);
    ::close(_fd);
  }
}

CampaignStore::CampaignStore(const fs::path &workspace,
                             const std::string &campaign_id)
    : _dir(campaigns_dir(workspace) / campaign_id) {
  if (!is_campaign_id(campaign_id)) {
    throw CampaignNotFound(campaign_id);
  }
}

bool CampaignStore::is_campaign_id(const std::string &text) {
  // only the canonical lowercase form campaigns are created with
  if (text.size() != 36) {
    return false;
  }
  try {
    return boost::uuids::to_string(boost::uuids::string_generator()(text)) ==
           text;
  } catch (const std::runtime_error &) {
    return false;
  }
}

fs::path CampaignStore::campaigns_dir(const fs::path &workspace) {
  return workspace / "campaigns";
}

std::vector<std::string>
CampaignStore::list_campaigns(const fs::path &workspace) {
  std::vector<std::string> ids;
  const fs::path root = campaigns_dir(workspace);
  boost::system::error_code ec;
  if (!fs::is_directory(root, ec)) {
    return ids;
  }
  for (fs::directory_iterator it(root, ec), end; !ec && it != end;
       it.increment(ec)) {
    const std::string name = it->path().filename().string();
    if (is_campaign_id(name) &&
        fs::is_regular_file(it->path() / "config.json")) {
      ids.push_back(name);
    }
  }
  if (ec) {
    throw StorageError("Cannot list " + root.string() + ": " + ec.message());
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

fs::path CampaignStore::config_path() const { return _dir / "config.json"; }
fs::path CampaignStore::runs_dir() const { return _dir / "runs"; }
fs::path CampaignStore::batch_path(const std::string &batch_id) const {
  return runs_dir() / (batch_id + ".csv");
}
fs::path CampaignStore::optimizer_state_path() const {
  return _dir / "optimizer_state.bin";
}
fs::path CampaignStore::lock_path() const { return _dir / ".lock"; }

bool CampaignStore::exists() const {
  boost::system::error_code ec;
  return fs::is_regular_file(config_path(), ec);
}

void CampaignStore::save_config(const CampaignConfig &config) const {
  write_file_atomic(config_path(), config.serialize());
}

CampaignConfig CampaignStore::load_config(bool *migrated) const {
  return CampaignConfig::deserialize(read_file(config_path()), migrated);
}

void CampaignStore::save_batch(const CampaignConfig &config,
                               const RunBatch &batch,
                               const std::vector<RunResult> &results) const {
  // Parameter columns: current parameters first, then any older ones the
  // rows still carry.
  std::vector<std::string> param_cols;
  std::set<std::string> row_keys;
  for (const auto &row : batch.rows) {
    for (const auto &kv : row) {
      row_keys.insert(kv.first);
    }
  }
  for (const auto &name : config.parameters().names()) {
    if (row_keys.erase(name)) {
      param_cols.push_back(name);
    }
  }
  param_cols.insert(param_cols.end(), row_keys.begin(), row_keys.end());

  std::vector<std::string> objective_cols = config.objectives().names();
  std::set<std::string> extra;
  for (const auto &r : results) {
    for (const auto &kv : r.values) {
      if (!config.objectives().find(kv.first)) {
        extra.insert(kv.first);
      }
    }
  }
  objective_cols.insert(objective_cols.end(), extra.begin(), extra.end());

  std::vector<std::string> header = param_cols;
  header.push_back("batch_id");
  header.push_back("row_index");
  header.push_back("status");
  header.insert(header.end(), objective_cols.begin(), objective_cols.end());
  header.push_back("source");
  header.push_back("generated_at");
  header.push_back("ingested_at");
  header.push_back("config_version");

  std::map<size_t, const RunResult *> by_row;
  for (const auto &r : results) {
    by_row[r.row_index] = &r;
  }

  std::string out = detail::csv_line(header);
  for (size_t i = 0; i < batch.rows.size(); ++i) {
    const Row &row = batch.rows[i];
    std::vector<std::string> cells;
    for (const auto &col : param_cols) {
      auto it = row.find(col);
      cells.push_back(it == row.end() ? std::string() : it->second.to_string());
    }
    cells.push_back(batch.batch_id);
    cells.push_back(std::to_string(i));
    cells.push_back(to_string(batch.status));

    auto rit = by_row.find(i);
    const RunResult *result = rit == by_row.end() ? nullptr : rit->second;
    for (const auto &col : objective_cols) {
      if (result && result->values.count(col)) {
        cells.push_back(format_double(result->values.at(col)));
      } else {
        cells.push_back(std::string());
      }
    }
    cells.push_back(to_string(batch.source));
    cells.push_back(std::to_string(batch.generated_at));
    cells.push_back(result ? std::to_string(result->ingested_at)
                           : std::string());
    cells.push_back(std::to_string(batch.config_version));
    out += detail::csv_line(cells);
  }
  write_file_atomic(batch_path(batch.batch_id), out);
}

RunHistory CampaignStore::load_history(const CampaignConfig &config) const {
  std::vector<RunBatch> batches;
  std::vector<RunResult> results;

  const fs::path dir = runs_dir();
  boost::system::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    return RunHistory();
  }
  std::vector<fs::path> files;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    // temp files of interrupted writes end in .tmp.<pid>.<n>
    if (it->path().extension() == ".csv") {
      files.push_back(it->path());
    }
  }
  if (ec) {
    throw StorageError("Cannot list " + dir.string() + ": " + ec.message());
  }
  std::sort(files.begin(), files.end());

  for (const auto &file : files) {
    ParsedBatch parsed = parse_batch_file(config, file);
    if (parsed.batch.batch_id + ".csv" != file.filename().string()) {
      throw StorageError("Batch file " + file.string() +
                         " holds batch " + parsed.batch.batch_id);
    }
    batches.push_back(std::move(parsed.batch));
    for (auto &r : parsed.results) {
      results.push_back(std::move(r));
    }
  }
  get_logger("store")->debug("Loaded {} batches and {} results from {}",
                             batches.size(), results.size(), dir.string());
  return RunHistory::from_records(std::move(batches), std::move(results));
}

void CampaignStore::save_optimizer_state(
    const OptimizerStateRecord &state) const {
  std::ostringstream out;
  out << kStateMagic << "\n"
      << "config_hash " << state.config_hash << "\n"
      << "observations " << state.observations << "\n"
      << "built_at " << state.built_at << "\n"
      << "size " << state.blob.size() << "\n"
      << state.blob;
  write_file_atomic(optimizer_state_path(), out.str());
}

boost::optional<OptimizerStateRecord>
CampaignStore::load_optimizer_state() const {
  const fs::path path = optimizer_state_path();
  boost::system::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return boost::none;
  }
  const std::string text = read_file(path);
  std::istringstream in(text);

  auto field = [&](const std::string &key) {
    std::string line;
    if (!std::getline(in, line) || line.compare(0, key.size() + 1, key + " ")) {
      throw StorageError("Optimizer state " + path.string() +
                         " lacks header field '" + key + "'");
    }
    return line.substr(key.size() + 1);
  };

  std::string magic;
  if (!std::getline(in, magic) || magic != kStateMagic) {
    throw StorageError("Optimizer state " + path.string() +
                       " has an unknown format");
  }
  OptimizerStateRecord state;
  state.config_hash = field("config_hash");
  state.observations =
      static_cast<size_t>(parse_integer(field("observations"), "observations"));
  state.built_at = parse_integer(field("built_at"), "built_at");
  const size_t size = static_cast<size_t>(parse_integer(field("size"), "size"));

  const std::streamoff offset = in.tellg();
  if (offset < 0 || text.size() - static_cast<size_t>(offset) != size) {
    throw StorageError("Optimizer state " + path.string() + " is truncated");
  }
  state.blob = text.substr(static_cast<size_t>(offset));
  return state;
}

std::vector<RunResult> results_for_batch(const RunHistory &history,
                                         const std::string &batch_id) {
  std::vector<RunResult> out;
  for (const auto &r : history.results()) {
    if (r.batch_id == batch_id) {
      out.push_back(r);
    }
  }
  std::sort(out.begin(), out.end(),
            [](const RunResult &a, const RunResult &b) {
              return a.row_index < b.row_index;
            });
  return out;
}

} // namespace basil
