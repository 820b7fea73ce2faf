#ifndef __KERNVAL_OPTIONS_HPP__
#define __KERNVAL_OPTIONS_HPP__

// Command line options. Each option is a global Option<T> object that
// registers itself (and its alias) with the OptionRegistry on construction.

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>
#include <string>
#include <type_traits>
#include <unordered_map>

#include "aux.hpp"

namespace Kernval {

enum class OptionKind {
  User = 0,
  Hidden = 1,
};

class OptionBase {
public:
  OptionKind kind = OptionKind::User;
  explicit OptionBase(OptionKind ok) : kind(ok) {}
  virtual ~OptionBase() {}

  virtual bool Parse(int argc, char** argv, int& currentArg) = 0;
  virtual const std::string Description() const = 0;
  virtual const std::string GetName() const = 0;
  virtual const std::string GetAlias() const = 0;

private:
  std::string err;

public:
  void SetError(const std::string& e) { err = e; }
  const std::string GetError() const { return err; }
};

template <typename T>
class Option : public OptionBase {
private:
  std::string name;  // option name
  std::string alias; // name alias
  T value;
  T default_value;
  std::string description;   // explanation of this option
  std::string option_desc;   // how the option is spelled in the help
  bool requires_arg = false; // takes a value: '-o file' or '-o=file'

  bool ReadValue(const std::string& text);

public:
  Option(OptionKind, const std::string&, const std::string&, const T&,
         const std::string& = "", const std::string& = "", bool = false);
  ~Option();

  bool Parse(int argc, char** argv, int& currentArg) override;

  T GetValue() const { return value; }
  operator T() const { return value; }
  void operator=(const T& v) { value = v; }

  const std::string Description() const override;
  const std::string GetName() const override { return name; }
  const std::string GetAlias() const override { return alias; }
};

class OptionRegistry {
private:
  std::unordered_map<std::string, OptionBase*> options;

  std::string input_filename;
  std::ifstream input_file_stream;
  std::ofstream output_file_stream;
  std::ostream* output_stream = nullptr;
  bool stdin_as_input = false;

  std::ostringstream ess;
  int ret_code = 0;

  static constexpr int help_width = 28;

public:
  static OptionRegistry& GetInstance() {
    static OptionRegistry instance;
    return instance;
  }

  void Reset() {
    input_filename.clear();
    if (input_file_stream.is_open()) input_file_stream.close();
    if (output_file_stream.is_open()) output_file_stream.close();
    output_stream = nullptr;
    stdin_as_input = false;
    ess.str("");
    ret_code = 0;
  }

  void RegisterOption(const std::string& name, OptionBase* option) {
    if (options.count(name))
      kernval_unreachable("option '" + name + "' has been registered twice.");
    options[name] = option;
  }

  void UnRegisterOption(const std::string& name) {
    auto it = options.find(name);
    if (it == options.end()) return;
    auto alias = it->second->GetAlias();
    options.erase(it);
    if (!alias.empty()) options.erase(alias);
  }

  // parse the whole command line; returns false on error or on '--help'
  bool Parse(int argc, char** argv) {
    Reset();
    for (int i = 1; i < argc; ++i)
      if (!Parse(argc, argv, i)) return false;

    if (!stdin_as_input && input_filename.empty()) {
      ess << "error: no input file.";
      ret_code = 1;
      return false;
    }
    return true;
  }

  // parse the argument at `i`, and its value if it takes one
  bool Parse(int argc, char** argv, int& i) {
    assert(i < argc && "the argument is out of bound.");

    std::string arg = argv[i];
    auto option = arg.substr(0, arg.find('='));

    if (option == "--help" || option == "-H") {
      Help(OptionKind::User);
      return false;
    } else if (option == "--help-hidden") {
      Help(OptionKind::Hidden);
      return false;
    }

    if (auto it = options.find(option); it != options.end()) {
      if (it->second->Parse(argc, argv, i)) return true;
      ess << "error: " << it->second->GetError();
      ret_code = 1;
      return false;
    }

    if (arg != "-" && PrefixedWith(arg, "-")) {
      ess << "error: unknown option '" << arg << "'.";
      ret_code = 1;
      return false;
    }

    if (!input_filename.empty() || stdin_as_input) {
      ess << "error: more than one input file: '"
          << (stdin_as_input ? "-" : input_filename) << "' and '" << arg
          << "'.";
      ret_code = 1;
      return false;
    }
    if (arg == "-")
      stdin_as_input = true;
    else
      input_filename = arg;
    return true;
  }

  const std::string Message() const { return ess.str(); }
  int ReturnCode() const { return ret_code; }

  bool StdinAsInput() const { return stdin_as_input; }
  const std::string GetInputFileName() const { return input_filename; }
  const std::string GetInputName() const {
    if (stdin_as_input) return "<stdin>";
    return RemoveDirectoryPrefix(RemoveSuffix(input_filename, ".kmd"));
  }

  std::istream& GetInputStream() {
    if (stdin_as_input || input_filename.empty()) return std::cin;
    if (!input_file_stream.is_open()) input_file_stream.open(input_filename);
    return input_file_stream;
  }

  std::ostream& GetOutputStream() {
    return output_stream ? *output_stream : std::cout;
  }

  // returns false if the file can not be opened; '-' and "" mean stdout
  bool SetOutputStream(const std::string& filename) {
    if (filename.empty() || filename == "-") return true;
    output_file_stream.open(filename);
    if (!output_file_stream.is_open()) return false;
    output_stream = &output_file_stream;
    return true;
  }

  void Help(OptionKind ok) {
    std::cout << "Usage: kernval [options] <file.kmd>\n";
    std::cout << "Options:\n";
    std::cout << "  " << std::setw(help_width) << std::left << "--help"
              << "Display this information.\n";
    std::cout << "  " << std::setw(help_width) << std::left << "--help-hidden"
              << "Display hidden options.\n";

    std::vector<std::string> keys;
    for (auto& item : options) keys.push_back(item.first);
    std::sort(keys.begin(), keys.end());

    // an aliased option is registered under both of its names
    std::set<OptionBase*> printed;
    for (auto& name : keys) {
      auto* option = options.at(name);
      if (!printed.insert(option).second) continue;
      if ((int)option->kind > (int)ok) continue;
      auto desc = option->Description();
      if (!desc.empty()) std::cout << desc << "\n";
    }
    std::cout << "\n";
    ret_code = 0;
  }

  static int HelpWidth() { return help_width; }
};

template <typename T>
inline Option<T>::Option(OptionKind ok, const std::string& name,
                         const std::string& alias, const T& default_val,
                         const std::string& desc, const std::string& opt_d,
                         bool req)
    : OptionBase(ok), name(name), alias(alias), value(default_val),
      default_value(default_val), description(desc), option_desc(opt_d),
      requires_arg(req) {
  OptionRegistry::GetInstance().RegisterOption(name, this);
  if (!alias.empty()) OptionRegistry::GetInstance().RegisterOption(alias, this);
}

template <typename T>
inline Option<T>::~Option() {
  OptionRegistry::GetInstance().UnRegisterOption(name);
}

template <typename T>
inline const std::string Option<T>::Description() const {
  std::string spelled = option_desc.empty() ? name : option_desc;
  if (!alias.empty()) spelled = alias + ", " + spelled;

  std::ostringstream oss;
  oss << "  " << std::setw(OptionRegistry::HelpWidth()) << std::left
      << spelled;
  if ((int)spelled.size() >= OptionRegistry::HelpWidth())
    oss << "\n  " << std::string(OptionRegistry::HelpWidth(), ' ');
  oss << description;
  return oss.str();
}

template <typename T>
inline bool Option<T>::ReadValue(const std::string& text) {
  if constexpr (std::is_same_v<T, std::string>) {
    value = text;
    return true;
  } else {
    // istream wraps a negative number into an unsigned one
    if constexpr (std::is_unsigned_v<T> && !std::is_same_v<T, bool>) {
      auto first = text.find_first_not_of(" \t");
      if (first != std::string::npos && text[first] == '-') {
        SetError("invalid value '" + text + "' for option " + name + ".");
        return false;
      }
    }
    std::istringstream iss(text);
    T v;
    if (!(iss >> v) || !iss.eof()) {
      SetError("invalid value '" + text + "' for option " + name + ".");
      return false;
    }
    value = v;
    return true;
  }
}

template <typename T>
inline bool Option<T>::Parse(int argc, char** argv, int& currentArg) {
  std::string arg = argv[currentArg];
  auto pos = arg.find('=');
  if (pos != std::string::npos) return ReadValue(arg.substr(pos + 1));

  if (!requires_arg) {
    value = default_value;
    return true;
  }
  if (currentArg + 1 < argc) return ReadValue(argv[++currentArg]);

  SetError("option " + name + " requires an argument.");
  return false;
}

// boolean options are switches: '-v' turns on, '-v=false' turns off
template <>
inline bool Option<bool>::Parse(int argc, char** argv, int& currentArg) {
  assert(currentArg < argc &&
         "current argument index exceeds the total count.");
  (void)argc;

  std::string arg = argv[currentArg];
  auto pos = arg.find('=');
  if (pos == std::string::npos) {
    value = true;
    return true;
  }

  auto text = ToLower(arg.substr(pos + 1));
  if (text == "true" || text == "1")
    value = true;
  else if (text == "false" || text == "0")
    value = false;
  else {
    SetError("invalid value for boolean option " + name + ": '" +
             arg.substr(pos + 1) + "'.");
    return false;
  }
  return true;
}

} // end namespace Kernval

#endif // __KERNVAL_OPTIONS_HPP__
