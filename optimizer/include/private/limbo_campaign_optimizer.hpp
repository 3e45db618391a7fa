#pragma once
#include <algorithm>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <Eigen/Core>
#include <boost/filesystem.hpp>
#include <limbo/serialize/text_archive.hpp>

#include "private/limbo_params.hpp"
#include <public/atomic_file.hpp>
#include <public/campaign_optimizer.hpp>

namespace basil {
namespace detail {

/**
 * @brief CampaignOptimizer on a limbo GP with an NLopt-maximized acquisition.
 *
 * Proposals stay uniform random until initial_random_samples observations,
 * and at least one, exist. Within one act() call candidates are spread with the kriging
 * believer: each pick is added to a scratch copy of the model with its
 * predicted mean as observation.
 */
template <typename Kernel, template <typename, typename> class Acqui>
class LimboCampaignOptimizer : public CampaignOptimizer {
public:
  using model_t = gp_t<Kernel>;
  using acquisition_function_t = Acqui<Params, model_t>;

  LimboCampaignOptimizer(size_t dim_in, size_t initial_random_samples)
      : _model(static_cast<int>(dim_in), 1),
        _initial_random_samples(initial_random_samples), _dim_in(dim_in) {}

  size_t dim_in() const override { return _dim_in; }
  size_t observation_count() const override { return _samples.size(); }

  std::vector<Eigen::VectorXd> act(size_t n,
                                   const std::atomic<bool> &stop) override {
    std::vector<Eigen::VectorXd> batch;
    if (_samples.empty() || _samples.size() < _initial_random_samples) {
      for (size_t i = 0; i < n && !stop; ++i) {
        batch.push_back(tools::random_vector(_dim_in, true));
      }
      return batch;
    }

    _ensure_computed();
    model_t believer = _model;
    acqui_opt_t acqui_optimizer;
    for (size_t i = 0; i < n && !stop; ++i) {
      acquisition_function_t acqui(believer, _iteration + static_cast<int>(i));
      // once stopped, evaluations are flat and cheap so NLopt ends quickly
      auto acqui_optimization = [&](const Eigen::VectorXd &x,
                                    bool g) -> opt::eval_t {
        if (stop) {
          return opt::no_grad(0.0);
        }
        return acqui(x, FirstElem(), g);
      };
      Eigen::VectorXd starting_point = tools::random_vector(_dim_in, true);
      Eigen::VectorXd new_sample =
          acqui_optimizer(acqui_optimization, starting_point, true);
      if (stop) {
        break;
      }
      batch.push_back(new_sample);
      if (i + 1 < n) {
        believer.add_sample(new_sample, believer.mu(new_sample));
      }
    }
    return batch;
  }

  void update(const Eigen::VectorXd &sample, double observation) override {
    if (static_cast<size_t>(sample.size()) != _dim_in) {
      throw std::invalid_argument("Sample dimension " +
                                  std::to_string(sample.size()) +
                                  " does not match engine dimension " +
                                  std::to_string(_dim_in));
    }
    Eigen::VectorXd obs = Eigen::VectorXd::Constant(1, observation);
    _samples.push_back(sample);
    _observations.push_back(obs);
    if (_computed) {
      _model.add_sample(sample, obs);
    }
    _iteration++;
  }

  void refit() override {
    if (_samples.empty()) {
      return;
    }
    _ensure_computed();
    _model.optimize_hyperparams();
  }

  Eigen::VectorXd best_arm_prediction() const override {
    if (_observations.empty()) {
      return Eigen::VectorXd();
    }
    auto rewards = std::vector<double>(_observations.size());
    std::transform(_observations.begin(), _observations.end(), rewards.begin(),
                   FirstElem());
    auto max_e = std::max_element(rewards.begin(), rewards.end());
    const Eigen::VectorXd &best_arm =
        _samples[std::distance(rewards.begin(), max_e)];

    Eigen::VectorXd result(_dim_in + 2);
    if (_computed) {
      double uncertainty =
          _model.sigma(best_arm) - _model.kernel_function().noise();
      result << best_arm, _model.mu(best_arm)(0), std::max(0.0, uncertainty);
    } else {
      result << best_arm, *max_e, 0.0;
    }
    return result;
  }

  /**
   * Header (dimension, iteration, sample count) followed by the files of a
   * limbo TextArchive of the model, each as "<name> <size>" and raw bytes.
   */
  std::string save() const override {
    std::ostringstream out;
    out << "dim_in " << _dim_in << "\n";
    out << "iteration " << _iteration << "\n";
    out << "samples " << _samples.size() << "\n";
    if (_samples.empty()) {
      out << "archive 0\n";
      return out.str();
    }

    ArchiveDirectory dir;
    model_t gp_model = _model;
    if (!_computed) {
      gp_model.compute(_samples, _observations);
    }
    gp_model.template save<serialize::TextArchive>(
        serialize::TextArchive(dir.path().string()));

    std::vector<std::string> names;
    for (const auto &name : archive_objects()) {
      if (boost::filesystem::exists(dir.file(name))) {
        names.push_back(name);
      }
    }
    out << "archive " << names.size() << "\n";
    for (const auto &name : names) {
      const std::string content = read_file(dir.file(name));
      out << name << " " << content.size() << "\n" << content;
    }
    return out.str();
  }

  void load(const std::string &blob) override {
    std::istringstream in(blob);
    size_t dim = 0, count = 0, files = 0;
    int iteration = 0;
    _expect(in, "dim_in");
    in >> dim;
    if (!in || dim != _dim_in) {
      throw std::runtime_error("Engine state has dimension " +
                               std::to_string(dim) + ", expected " +
                               std::to_string(_dim_in));
    }
    _expect(in, "iteration");
    in >> iteration;
    _expect(in, "samples");
    in >> count;
    _expect(in, "archive");
    in >> files;
    if (!in || files > archive_objects().size()) {
      throw std::runtime_error("Engine state header is malformed");
    }

    std::map<std::string, std::string> archive;
    for (size_t i = 0; i < files; ++i) {
      std::string name;
      size_t size = 0;
      in >> name >> size;
      if (!in || in.get() != '\n') {
        throw std::runtime_error("Engine state holds a malformed entry");
      }
      if (std::find(archive_objects().begin(), archive_objects().end(),
                    name) == archive_objects().end()) {
        throw std::runtime_error("Engine state holds unknown object '" + name +
                                 "'");
      }
      std::string content(size, '\0');
      if (size > 0 && !in.read(&content[0], static_cast<std::streamsize>(size))) {
        throw std::runtime_error("Engine state is truncated");
      }
      archive[name] = content;
    }

    model_t model(static_cast<int>(_dim_in), 1);
    if (count == 0) {
      if (!archive.empty()) {
        throw std::runtime_error("Engine state has an archive but no samples");
      }
    } else {
      // limbo's archive reader asserts on missing or ragged files.
      _check_shape(archive, "samples", count, _dim_in);
      _check_shape(archive, "observations", count, 1);
      _check_shape(archive, "kernel_params",
                   model.kernel_function().h_params_size(), 1);
      _check_shape(archive, "mean_params",
                   model.mean_function().h_params_size(), 1);

      ArchiveDirectory dir;
      for (const auto &entry : archive) {
        std::ofstream file(dir.file(entry.first).string(),
                           std::ios::binary | std::ios::trunc);
        if (!file.write(entry.second.data(),
                        static_cast<std::streamsize>(entry.second.size()))) {
          throw std::runtime_error("Cannot unpack engine state to " +
                                   dir.path().string());
        }
      }
      model.template load<serialize::TextArchive>(
          serialize::TextArchive(dir.path().string()));
    }

    std::vector<Eigen::VectorXd> samples, observations;
    if (count > 0) {
      samples = model.samples();
      for (long i = 0; i < model.observations().rows(); ++i) {
        observations.push_back(model.observations().row(i).transpose());
      }
    }
    _model = model;
    _computed = count > 0;
    _samples = samples;
    _observations = observations;
    _iteration = iteration;
  }

  std::unique_ptr<CampaignOptimizer> clone() const override {
    return std::unique_ptr<CampaignOptimizer>(
        new LimboCampaignOptimizer(*this));
  }

protected:
  void _ensure_computed() {
    if (!_computed) {
      _model.compute(_samples, _observations);
      _computed = true;
    }
  }

  /// Scratch directory for one archive, removed with its contents.
  class ArchiveDirectory {
  public:
    ArchiveDirectory()
        : _path(boost::filesystem::temp_directory_path() /
                boost::filesystem::unique_path("basil-gp-%%%%-%%%%-%%%%")) {
      boost::filesystem::create_directories(_path);
    }
    ~ArchiveDirectory() {
      boost::system::error_code ec;
      boost::filesystem::remove_all(_path, ec);
    }
    ArchiveDirectory(const ArchiveDirectory &) = delete;
    ArchiveDirectory &operator=(const ArchiveDirectory &) = delete;

    const boost::filesystem::path &path() const { return _path; }
    boost::filesystem::path file(const std::string &object) const {
      return _path / (object + ".dat");
    }

  private:
    boost::filesystem::path _path;
  };

  static const std::vector<std::string> &archive_objects() {
    static const std::vector<std::string> names = {
        "kernel_params", "mean_params", "observations", "samples"};
    return names;
  }

  static void _check_shape(const std::map<std::string, std::string> &archive,
                           const std::string &name, size_t rows, size_t cols) {
    auto it = archive.find(name);
    if (rows == 0) {
      if (it != archive.end()) {
        throw std::runtime_error("Engine state has unexpected '" + name + "'");
      }
      return;
    }
    if (it == archive.end()) {
      throw std::runtime_error("Engine state lacks '" + name + "'");
    }
    std::istringstream text(it->second);
    std::string line;
    size_t seen = 0;
    while (std::getline(text, line)) {
      std::istringstream cells(line);
      double value = 0.0;
      size_t n = 0;
      while (cells >> value) {
        ++n;
      }
      if (!cells.eof() || n != cols) {
        throw std::runtime_error("Engine state holds a malformed '" + name +
                                 "' row");
      }
      ++seen;
    }
    if (seen != rows) {
      throw std::runtime_error("Engine state holds " + std::to_string(seen) +
                               " rows of '" + name + "', expected " +
                               std::to_string(rows));
    }
  }

  static void _expect(std::istream &in, const std::string &key) {
    std::string word;
    if (!(in >> word) || word != key) {
      throw std::runtime_error("Engine state lacks '" + key + "'");
    }
  }

  model_t _model;
  bool _computed = false;
  std::vector<Eigen::VectorXd> _samples;
  std::vector<Eigen::VectorXd> _observations;
  int _iteration = 0;
  size_t _initial_random_samples;
  size_t _dim_in;
};

} // namespace detail
} // namespace basil
