/*
 * Copyright (c) 2026, the wlrt authors
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * 1. Redistributions of source code must retain the above copyright notice, this
 *    list of conditions and the following disclaimer.
 * 2. Redistributions in binary form must reproduce the above copyright notice,
 *    this list of conditions and the following disclaimer in the documentation
 *    and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND
 * ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 * DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER OR CONTRIBUTORS BE LIABLE FOR
 * ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
 * (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
 * LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
 * ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <utility>

#include <pugixml.hpp>

#include <wlrt-config.hpp>

using namespace wlrt;

namespace
{
  // Apply one "key = value" setting. On failure error describes why.
  bool apply(config_t &config, std::string const &key, std::string const &value, std::string &error)
  {
    if(key == "title")
      {
        config.title = value;
        return true;
      }
    if(key == "app-id")
      {
        if(value.empty())
          {
            error = "must not be empty";
            return false;
          }
        config.app_id = value;
        return true;
      }
    if(key == "background")
      {
        uint32_t argb = 0;
        if(!parse_color(value, argb))
          {
            error = "invalid color \"" + value + "\"";
            return false;
          }
        config.background = argb;
        return true;
      }
    error = "unknown field";
    return false;
  }

  void load_file(config_t &config, std::string const &path, bool explicit_file)
  {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());
    if(!result)
      {
        // a missing default file simply means nothing is configured
        if(result.status == pugi::status_file_not_found && !explicit_file)
          return;
        std::stringstream ss;
        ss << path << ": " << result.description();
        if(result.status != pugi::status_file_not_found && result.status != pugi::status_io_error)
          ss << " at offset " << result.offset;
        config.diagnostics.add(diagnostic_location::file, "", ss.str());
        return;
      }

    pugi::xml_node root = doc.child("wlrt");
    if(!root)
      {
        config.diagnostics.add(diagnostic_location::file, "", path + ": missing <wlrt> root element");
        return;
      }

    for(pugi::xml_attribute attribute : root.attributes())
      config.diagnostics.add(diagnostic_location::file, attribute.name(), path + ": unknown attribute");

    for(pugi::xml_node node : root.children())
      {
        if(node.type() != pugi::node_element)
          continue;
        for(pugi::xml_attribute attribute : node.attributes())
          config.diagnostics.add(diagnostic_location::file, std::string(node.name()) + "." + attribute.name(),
                                 path + ": unknown attribute");
        std::string error;
        if(!apply(config, node.name(), node.child_value(), error))
          config.diagnostics.add(diagnostic_location::file, node.name(), path + ": " + error);
      }
  }
}

diagnostic_t::diagnostic_t(diagnostic_location location, std::string const &key, std::string const &message)
  : location(location), key(key), message(message)
{
}

void diagnostic_t::write(std::ostream &os) const
{
  switch(location)
    {
    case diagnostic_location::cli:
      os << "cli: ";
      break;
    case diagnostic_location::file:
      os << "file: ";
      break;
    case diagnostic_location::none:
      break;
    }
  if(!key.empty())
    os << key << ": ";
  os << message;
}

bool diagnostic_t::operator==(const diagnostic_t &right) const
{
  return location == right.location && key == right.key && message == right.message;
}

bool diagnostic_t::operator!=(const diagnostic_t &right) const
{
  return !(*this == right);
}

void diagnostics_t::add(diagnostic_location location, std::string const &key, std::string const &message)
{
  items.push_back(diagnostic_t(location, key, message));
}

bool diagnostics_t::empty() const
{
  return items.empty();
}

const std::vector<diagnostic_t> &diagnostics_t::get_items() const
{
  return items;
}

bool diagnostics_t::contains_location(diagnostic_location location) const
{
  return std::any_of(items.begin(), items.end(),
                     [location] (const diagnostic_t &d) { return d.location == location; });
}

bool diagnostics_t::operator==(const diagnostics_t &right) const
{
  return items == right.items;
}

bool diagnostics_t::operator!=(const diagnostics_t &right) const
{
  return !(*this == right);
}

config_t config_t::load(const config_sources_t &sources)
{
  config_t config;
  std::string file = sources.file;

  // Command line settings win over the file, so they are applied last,
  // but --config-file has to be known before the file is read.
  std::vector<std::pair<std::string, std::string>> settings;
  for(auto const &arg : sources.args)
    {
      if(arg.compare(0, 2, "--") != 0)
        {
          config.diagnostics.add(diagnostic_location::cli, arg, "invalid argument, expected --key=value");
          continue;
        }
      std::string::size_type eq = arg.find('=');
      if(eq == std::string::npos)
        {
          config.diagnostics.add(diagnostic_location::cli, arg.substr(2), "missing value");
          continue;
        }
      std::string key = arg.substr(2, eq - 2);
      std::string value = arg.substr(eq + 1);
      if(key == "config-file")
        file = value;
      else
        settings.push_back(std::make_pair(key, value));
    }

  bool explicit_file = !file.empty();
  if(!explicit_file && !sources.skip_default_file)
    file = default_file();
  if(!file.empty())
    load_file(config, file, explicit_file);

  for(auto const &setting : settings)
    {
      std::string error;
      if(!apply(config, setting.first, setting.second, error))
        config.diagnostics.add(diagnostic_location::cli, setting.first, error);
    }

  return config;
}

std::string config_t::default_file()
{
  const char *xdg_config_home = std::getenv("XDG_CONFIG_HOME");
  if(xdg_config_home && *xdg_config_home)
    return std::string(xdg_config_home) + "/wlrt/config.xml";
  const char *home = std::getenv("HOME");
  if(home && *home)
    return std::string(home) + "/.config/wlrt/config.xml";
  return "";
}

bool config_t::operator==(const config_t &right) const
{
  return title == right.title
    && app_id == right.app_id
    && background == right.background
    && diagnostics == right.diagnostics;
}

bool config_t::operator!=(const config_t &right) const
{
  return !(*this == right);
}

bool wlrt::parse_color(std::string const &str, uint32_t &argb)
{
  if(str.empty() || str[0] != '#')
    return false;
  std::string digits = str.substr(1);
  if(digits.size() != 6 && digits.size() != 8)
    return false;
  if(!std::all_of(digits.begin(), digits.end(), [] (char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; }))
    return false;

  uint32_t value = static_cast<uint32_t>(std::strtoul(digits.c_str(), nullptr, 16));
  if(digits.size() == 6)
    value |= 0xff000000;
  argb = value;
  return true;
}
