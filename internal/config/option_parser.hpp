#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "config/config.pb.h"

namespace pointzilla::config {

struct ParsedCommandLine {
  pointzilla::runtime::config::RunConfig config;
  bool                                   show_help = false;
};

/*
  Command line -> RunConfig.

    pointzilla [-option=value | /option=value]... [@optionsFile]...
               [command] [identifierOrGuid] [value|gap]... [csvFile]...

  -Config=path.yaml is applied first; every other option then overrides it in
  argument order. Option names are case-insensitive.
*/
class OptionParser {
 public:
  OptionParser();

  // Throws util::ConfigurationError.
  ParsedCommandLine Parse(const std::vector<std::string>& args) const;

  std::string Usage(std::string_view program) const;

  // Inlines "@file" arguments: one option per line, blank and comment lines dropped.
  static std::vector<std::string> ExpandOptionFiles(const std::vector<std::string>& args);

 private:
  using Setter = std::function<void(pointzilla::runtime::config::RunConfig&, const std::string&)>;

  struct Option {
    std::string key; // empty for section headings
    std::string description;
    Setter      setter;
  };

  void AddSection(std::string title);
  void Add(std::string key, std::string description, Setter setter);

  const Option* Find(std::string_view key) const;
  void          ApplyPositional(pointzilla::runtime::config::RunConfig& config, const std::string& arg) const;

  std::vector<Option> options_;
};

} // namespace pointzilla::config
