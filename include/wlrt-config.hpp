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

#ifndef WLRT_CONFIG_HPP
#define WLRT_CONFIG_HPP

/** \file */

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace wlrt
{
  /** \brief Where a configuration problem was found
   */
  enum class diagnostic_location
  {
    none,
    cli,
    file
  };

  /** \brief A problem found while loading the configuration
   */
  struct diagnostic_t
  {
    diagnostic_location location;
    std::string key;
    std::string message;

    diagnostic_t(diagnostic_location location, std::string const &key, std::string const &message);

    /** \brief Write a one line, human readable description
     */
    void write(std::ostream &os) const;

    bool operator==(const diagnostic_t &right) const;
    bool operator!=(const diagnostic_t &right) const;
  };

  class diagnostics_t
  {
  private:
    std::vector<diagnostic_t> items;

  public:
    void add(diagnostic_location location, std::string const &key, std::string const &message);
    bool empty() const;
    const std::vector<diagnostic_t> &get_items() const;

    /** \brief Whether any diagnostic originates from the given location
     */
    bool contains_location(diagnostic_location location) const;

    bool operator==(const diagnostics_t &right) const;
    bool operator!=(const diagnostics_t &right) const;
  };

  /** \brief Inputs of config_t::load()
   */
  struct config_sources_t
  {
    /** Command line arguments without the program name, "--key=value" */
    std::vector<std::string> args;

    /** Configuration file. When empty, $XDG_CONFIG_HOME/wlrt/config.xml
        (or $HOME/.config/wlrt/config.xml) is read if it exists. */
    std::string file;

    /** Read no file unless one is given explicitly */
    bool skip_default_file = false;
  };

  /** \brief A configuration snapshot

      Defaults are overridden by the XML file, which is overridden by the
      command line. Problems do not make loading fail; they are collected
      as diagnostics and the affected setting keeps its previous value.
  */
  class config_t
  {
  public:
    std::string title = "wlrt";
    std::string app_id = "org.wlrt.wlrt";
    /** Window fill color, 0xAARRGGBB */
    uint32_t background = 0xffffffff;

    diagnostics_t diagnostics;

    /** \brief Load a new snapshot
     *
     * The file looks like
     * \code
     * <wlrt>
     *   <title>Scratch</title>
     *   <app-id>org.example.scratch</app-id>
     *   <background>#ff202020</background>
     * </wlrt>
     * \endcode
     * and the command line accepts --title=, --app-id=, --background= and
     * --config-file=.
     */
    static config_t load(const config_sources_t &sources = config_sources_t());

    /** \brief Default location of the configuration file, empty if neither
     *         XDG_CONFIG_HOME nor HOME is set
     */
    static std::string default_file();

    bool operator==(const config_t &right) const;
    bool operator!=(const config_t &right) const;
  };

  /** \brief Parse "#RRGGBB" or "#AARRGGBB"
      \return false if str is not a color
  */
  bool parse_color(std::string const &str, uint32_t &argb);
}

#endif
