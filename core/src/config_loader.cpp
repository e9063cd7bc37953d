#include "keyshell/core/config_loader.hpp"

#include <charconv>
#include <cstddef>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <boost/program_options.hpp>

namespace keyshell::core {

namespace po = boost::program_options;

namespace {

std::string_view trim(std::string_view text) {
  const std::size_t begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string_view::npos) {
    return {};
  }
  const std::size_t end = text.find_last_not_of(" \t\r\n");
  return text.substr(begin, end - begin + 1);
}

std::vector<std::string_view> split(std::string_view text, char separator) {
  std::vector<std::string_view> parts;
  std::size_t start = 0;
  while (true) {
    const std::size_t next = text.find(separator, start);
    if (next == std::string_view::npos) {
      parts.push_back(text.substr(start));
      return parts;
    }
    parts.push_back(text.substr(start, next - start));
    start = next + 1;
  }
}

bool parse_number(std::string_view text, double* out_value) {
  const std::string_view token = trim(text);
  if (token.empty()) {
    return false;
  }
  const char* first = token.data();
  const char* last = token.data() + token.size();
  if (*first == '+') {
    ++first;
  }
  const auto [ptr, ec] = std::from_chars(first, last, *out_value);
  return ec == std::errc() && ptr == last;
}

po::options_description shape_options() {
  po::options_description desc("Shape parameters");
  desc.add_options()
      ("nrows", po::value<int>(), "key rows")
      ("ncols", po::value<int>(), "key columns")
      ("alpha-deg", po::value<double>(), "curvature along each column (degrees per row)")
      ("beta-deg", po::value<double>(), "curvature along each row (degrees per column)")
      ("centerrow", po::value<double>(), "row that sits level (default nrows-3)")
      ("centercol", po::value<double>(), "column that sits level")
      ("tenting-deg", po::value<double>(), "tenting angle")
      ("pinky-15u", po::value<bool>(), "1.5u keys on the outer column")
      ("first-15u-row", po::value<int>(), "first 1.5u row")
      ("last-15u-row", po::value<int>(), "last 1.5u row")
      ("extra-row", po::value<bool>(), "extra bottom row")
      ("inner-column", po::value<bool>(), "inner index column")
      ("column-style", po::value<std::string>(), "standard, orthographic or fixed")
      ("column-offsets", po::value<std::string>(), "per-column offsets x,y,z;x,y,z;...")
      ("thumb-offsets", po::value<std::string>(), "thumb cluster offset x,y,z")
      ("keyboard-z-offset", po::value<double>(), "height of the matrix")
      ("extra-width", po::value<double>(), "extra space between key columns")
      ("extra-height", po::value<double>(), "extra space between key rows")
      ("wall-z-offset", po::value<double>(), "wall lip drop")
      ("wall-xy-offset", po::value<double>(), "wall lip reach")
      ("wall-thickness", po::value<double>(), "wall thickness")
      ("left-wall-x-offset", po::value<double>(), "left wall x offset")
      ("left-wall-z-offset", po::value<double>(), "left wall z offset")
      ("floor-z", po::value<double>(), "projection plane of the bottom hulls")
      ("fixed-angles-deg", po::value<std::string>(), "fixed style column angles")
      ("fixed-x", po::value<std::string>(), "fixed style column x positions")
      ("fixed-z", po::value<std::string>(), "fixed style column z positions")
      ("fixed-tenting-deg", po::value<double>(), "fixed style tenting angle")
      ("create-side-nubs", po::value<bool>(), "switch side nubs")
      ("keyswitch-width", po::value<double>(), "switch opening width")
      ("keyswitch-height", po::value<double>(), "switch opening height")
      ("plate-thickness", po::value<double>(), "switch plate thickness")
      ("web-thickness", po::value<double>(), "connector web thickness")
      ("base-plate-thickness", po::value<double>(), "base plate thickness");
  return desc;
}

class OptionReader {
 public:
  explicit OptionReader(const po::variables_map& vm) : vm_(vm) {}

  [[nodiscard]] bool has(const char* key) const { return vm_.count(key) > 0; }

  template <typename T>
  void read(const char* key, T* field) const {
    if (has(key)) {
      *field = vm_[key].as<T>();
    }
  }

  void read_angle(const char* key, double* field) const {
    if (has(key)) {
      *field = deg_to_rad(vm_[key].as<double>());
    }
  }

  bool read_vector(const char* key, Vec3d* field, std::string* error_message) const {
    if (!has(key)) {
      return true;
    }
    std::string detail;
    if (!parse_vector(vm_[key].as<std::string>(), field, &detail)) {
      *error_message = std::string("config: ") + key + ": " + detail;
      return false;
    }
    return true;
  }

  bool read_list(const char* key, std::vector<double>* field, std::string* error_message) const {
    if (!has(key)) {
      return true;
    }
    std::string detail;
    if (!parse_number_list(vm_[key].as<std::string>(), field, &detail)) {
      *error_message = std::string("config: ") + key + ": " + detail;
      return false;
    }
    return true;
  }

 private:
  const po::variables_map& vm_;
};

bool apply_shape_options(const po::variables_map& vm, ShapeParameters* params, std::string* error_message) {
  const OptionReader in(vm);
  ShapeParameters& p = *params;

  in.read("nrows", &p.nrows);
  in.read("ncols", &p.ncols);
  in.read_angle("alpha-deg", &p.alpha);
  in.read_angle("beta-deg", &p.beta);
  in.read("centercol", &p.centercol);
  in.read_angle("tenting-deg", &p.tenting_angle);
  in.read("pinky-15u", &p.pinky_15u);
  in.read("first-15u-row", &p.first_15u_row);
  in.read("last-15u-row", &p.last_15u_row);
  in.read("extra-row", &p.extra_row);
  in.read("inner-column", &p.inner_column);
  in.read("keyboard-z-offset", &p.keyboard_z_offset);
  in.read("extra-width", &p.extra_width);
  in.read("extra-height", &p.extra_height);
  in.read("wall-z-offset", &p.wall_z_offset);
  in.read("wall-xy-offset", &p.wall_xy_offset);
  in.read("wall-thickness", &p.wall_thickness);
  in.read("left-wall-x-offset", &p.left_wall_x_offset);
  in.read("left-wall-z-offset", &p.left_wall_z_offset);
  in.read("floor-z", &p.floor_z);
  in.read_angle("fixed-tenting-deg", &p.fixed_tenting);
  in.read("create-side-nubs", &p.switch_hole.create_side_nubs);
  in.read("keyswitch-width", &p.switch_hole.keyswitch_width);
  in.read("keyswitch-height", &p.switch_hole.keyswitch_height);
  in.read("plate-thickness", &p.switch_hole.plate_thickness);
  in.read("web-thickness", &p.web_thickness);
  in.read("base-plate-thickness", &p.base_plate_thickness);

  if (in.has("column-style") &&
      !parse_column_style(vm["column-style"].as<std::string>(), &p.column_style)) {
    *error_message = "config: column-style: unknown style '" + vm["column-style"].as<std::string>() + "'";
    return false;
  }
  if (!in.read_vector("thumb-offsets", &p.thumb_offsets, error_message) ||
      !in.read_list("fixed-x", &p.fixed_x, error_message) || !in.read_list("fixed-z", &p.fixed_z, error_message)) {
    return false;
  }
  if (in.has("fixed-angles-deg")) {
    std::vector<double> degrees;
    if (!in.read_list("fixed-angles-deg", &degrees, error_message)) {
      return false;
    }
    p.fixed_angles.clear();
    for (const double angle : degrees) {
      p.fixed_angles.push_back(deg_to_rad(angle));
    }
  }

  // Tables that follow the matrix size unless given explicitly.
  p.centerrow = in.has("centerrow") ? vm["centerrow"].as<double>() : p.nrows - 3.0;
  if (in.has("column-offsets")) {
    std::string detail;
    if (!parse_vector_list(vm["column-offsets"].as<std::string>(), &p.column_offsets, &detail)) {
      *error_message = "config: column-offsets: " + detail;
      return false;
    }
  } else {
    p.column_offsets = default_column_offsets(p.inner_column, p.ncols);
  }
  p.screw_inserts = default_screw_inserts(p.ncols, p.nrows);
  return true;
}

}  // namespace

bool parse_number_list(std::string_view text, std::vector<double>* out_values, std::string* error_message) {
  std::vector<double> values;
  for (const std::string_view part : split(text, ',')) {
    double value = 0.0;
    if (!parse_number(part, &value)) {
      if (error_message != nullptr) {
        *error_message = "not a number: '" + std::string(trim(part)) + "'";
      }
      return false;
    }
    values.push_back(value);
  }
  *out_values = std::move(values);
  return true;
}

bool parse_vector(std::string_view text, Vec3d* out_vector, std::string* error_message) {
  std::vector<double> values;
  if (!parse_number_list(text, &values, error_message)) {
    return false;
  }
  if (values.size() != 3) {
    if (error_message != nullptr) {
      *error_message = "expected x,y,z but got '" + std::string(trim(text)) + "'";
    }
    return false;
  }
  *out_vector = {values[0], values[1], values[2]};
  return true;
}

bool parse_vector_list(std::string_view text, std::vector<Vec3d>* out_vectors, std::string* error_message) {
  std::vector<Vec3d> vectors;
  for (const std::string_view part : split(text, ';')) {
    if (trim(part).empty()) {
      continue;
    }
    Vec3d vector{};
    if (!parse_vector(part, &vector, error_message)) {
      return false;
    }
    vectors.push_back(vector);
  }
  *out_vectors = std::move(vectors);
  return true;
}

GenerateResult<GeneratorConfig> LoadGeneratorConfig(int argc, const char* const argv[]) {
  GenerateResult<GeneratorConfig> result;
  GeneratorConfig& config = result.value;

  po::options_description generator("Generator options");
  generator.add_options()
      ("help,h", "show this help")
      ("config,c", po::value<std::string>(), "parameter file (INI, same keys as the shape parameters)")
      ("output-dir,o", po::value<std::string>()->default_value(config.output_dir), "directory for .stl files")
      ("left", po::bool_switch(&config.build.include_left), "also write the mirrored left half")
      ("no-test-pieces", po::bool_switch(), "skip the unit test pieces")
      ("validate-only", po::bool_switch(&config.validate_only), "check parameters and mesh, write nothing")
      ("log-level", po::value<std::string>()->default_value(config.log_level),
       "trace, debug, info, warn, error or off");
  const po::options_description shape = shape_options();
  po::options_description all("Allowed options");
  all.add(generator).add(shape);

  po::variables_map vm;
  try {
    // Values stored first win, so the command line goes in before the file.
    po::store(po::parse_command_line(argc, argv, all), vm);
    if (vm.count("config") > 0) {
      po::store(po::parse_config_file(vm["config"].as<std::string>().c_str(), shape), vm);
    }
    po::notify(vm);
  } catch (const po::error& e) {
    result.error = std::string("config: ") + e.what();
    return result;
  }

  if (vm.count("help") > 0) {
    std::ostringstream usage;
    usage << all;
    config.show_help = true;
    config.usage = usage.str();
    result.ok = true;
    return result;
  }

  config.output_dir = vm["output-dir"].as<std::string>();
  config.log_level = vm["log-level"].as<std::string>();
  config.build.include_test_pieces = !vm["no-test-pieces"].as<bool>();
  if (!apply_shape_options(vm, &config.params, &result.error)) {
    return result;
  }
  result.ok = true;
  return result;
}

GenerateResult<ShapeParameters> LoadShapeParameters(const std::string& ini_text) {
  GenerateResult<ShapeParameters> result;
  result.value = MakeDefaultShapeParameters();

  const po::options_description shape = shape_options();
  po::variables_map vm;
  try {
    std::istringstream in(ini_text);
    po::store(po::parse_config_file(in, shape), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    result.error = std::string("config: ") + e.what();
    return result;
  }

  if (!apply_shape_options(vm, &result.value, &result.error)) {
    return result;
  }
  result.ok = true;
  return result;
}

}  // namespace keyshell::core
