#ifndef INCLUDE_JSBOX_BOOTSTRAP_H_
#define INCLUDE_JSBOX_BOOTSTRAP_H_

#include <chrono>
#include <memory>
#include <string>

#include <spdlog/logger.h>
#include "fetcher.h"

extern const char kSecretMarker[];     // {{SECRET}}
extern const char kUserCodeMarker[];   // {{USER_CODE}}
extern const char kPolicyMarker[];     // {{DYNAMIC_CSP}}
extern const char kLibraryMarker[];    // {{LIBRARY_SCRIPTS}}
extern const char kUserCodeSourceName[];

constexpr std::chrono::milliseconds kTemplateLoadTimeout{5000};

// Produces the program installed into every fresh execution context.
//
// The built-in template is a node program that:
//  - creates a vm context whose console forwards every call as an envelope on stdout
//  - reports uncaught exceptions and unhandled rejections as "error" messages
//  - evaluates the library bundle (an array literal) element by element
//  - evaluates the user code, reports anything it throws, then sends "done"
class BootstrapTemplate {
  std::string source_;
  Fetcher& fetcher_;
  std::shared_ptr<spdlog::logger> logger_;
  std::chrono::milliseconds timeout_;
  std::string text_;
  bool loaded_;
 public:
  // source: empty for the built-in template, otherwise a path or an http(s) URL
  BootstrapTemplate(std::string source, Fetcher& fetcher, std::shared_ptr<spdlog::logger> logger,
                    std::chrono::milliseconds timeout = kTemplateLoadTimeout);

  // No-op once loaded. Never fails: any fetch or validation problem falls back to
  // DefaultTemplate().
  void Initialize();
  // Fetches the source again even if already loaded
  void ForceReload();
  bool IsLoaded() const { return loaded_; }
  const std::string& Text() const { return text_; }
  const std::string& Source() const { return source_; }

  // Throws TemplateIntegrityError naming every missing marker
  static void Validate(const std::string& text);
  static const std::string& DefaultTemplate();

  // Uses the built-in template until loaded. Every occurrence of each marker is replaced in one
  // pass; replacement text is never scanned for markers again. Markers may carry blanks inside
  // the braces ("{{ SECRET }}").
  std::string Render(const std::string& user_code, const std::string& secret,
                     const std::string& library_bundle, const std::string& policy) const;
};

// Escapes everything that would end the template literal holding the user code
std::string EscapeUserCode(const std::string& code);

#endif  // INCLUDE_JSBOX_BOOTSTRAP_H_
