// srcsym/config/analysis_config.hpp - Analysis configuration (YAML text)
//
// The configuration is read from YAML text handed over by the caller; this
// library never opens configuration files itself.
//
#pragma once

#include <set>
#include <string>
#include <string_view>
#include <utility>

namespace srcsym
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * `analysis:` section.
 */
struct AnalysisConfig
{
  /// Report unused imports (W001)
  bool unused_imports = true;

  /// Report unused top-level declarations (W002)
  bool unused_declarations = true;

  /// Report relative imports that resolve to no known file (W003)
  bool unresolved_imports = true;

  /// Do not report exported/public declarations as unused
  bool exempt_public = false;

  /// Names never reported as unused
  std::set<std::string> ignore_names;

  [[nodiscard]] bool is_ignored(std::string_view name) const
  {
    return ignore_names.find(std::string(name)) != ignore_names.end();
  }
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading an analysis configuration.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (defaults unless success == true)
  AnalysisConfig config;

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(AnalysisConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/**
 * Load an analysis configuration from YAML text.
 *
 * An empty document yields the defaults. Unknown keys are ignored; malformed
 * YAML or a value of the wrong type yields a failed result.
 */
[[nodiscard]] ConfigLoadResult load_analysis_config(std::string_view yaml);

}  // namespace srcsym
