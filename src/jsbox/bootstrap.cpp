#include <jsbox/bootstrap.h>

#include <cctype>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <jsbox/url.h>
#include <jsbox/errors.h>

#include "utils.h"

const char kSecretMarker[] = "{{SECRET}}";
const char kUserCodeMarker[] = "{{USER_CODE}}";
const char kPolicyMarker[] = "{{DYNAMIC_CSP}}";
const char kLibraryMarker[] = "{{LIBRARY_SCRIPTS}}";
const char kUserCodeSourceName[] = "user-code.js";

TemplateIntegrityError::TemplateIntegrityError(std::vector<std::string> missing) :
    std::runtime_error(fmt::format("Template missing required markers: {}",
                                   fmt::join(missing, ", "))),
    missing_(std::move(missing)) {}

namespace {

const char kFileScheme[] = "file://";

// Runs as a plain node program inside the jail. Envelopes go to stdout, one per line.
const char kDefaultTemplate[] = R"js('use strict';
const vm = require('vm');
const fs = require('fs');

const SECRET = "{{SECRET}}";
const POLICY = "{{DYNAMIC_CSP}}";

function writeLine(text) {
  const buf = Buffer.from(text + '\n', 'utf8');
  let off = 0;
  while (off < buf.length) {
    try {
      off += fs.writeSync(1, buf, off, buf.length - off);
    } catch (e) {
      if (e.code !== 'EAGAIN') return;
    }
  }
}

// errors may come from the guest realm, so instanceof does not work
function isError(v) {
  return Object.prototype.toString.call(v) === '[object Error]';
}

function cleanStack(stack) {
  if (typeof stack !== 'string') return '';
  const frames = [];
  for (const line of stack.split('\n')) {
    // line 1 of the script is the sourceURL comment
    const m = /user-code\.js:(\d+):(\d+)/.exec(line);
    if (m) frames.push('    at line ' + (m[1] - 1) + ', column ' + m[2]);
  }
  return frames.join('\n');
}

function stringify(v) {
  try {
    if (typeof v === 'string') return v;
    if (v === undefined) return 'undefined';
    if (v === null) return 'null';
    if (typeof v === 'function') return '[Function' + (v.name ? ': ' + v.name : '') + ']';
    if (typeof v !== 'object') return String(v);
    if (isError(v)) {
      let text = String(v.name) + ': ' + String(v.message);
      const stack = cleanStack(v.stack);
      if (stack) text += '\n' + stack;
      return text;
    }
    const seen = new WeakSet();
    const json = JSON.stringify(v, function (key, val) {
      if (typeof val === 'bigint') return val.toString() + 'n';
      if (typeof val === 'function') return '[Function' + (val.name ? ': ' + val.name : '') + ']';
      if (typeof val === 'object' && val !== null) {
        if (seen.has(val)) return '[Circular]';
        seen.add(val);
      }
      return val;
    });
    return json === undefined ? String(v) : json;
  } catch (e) {
    try {
      return Object.prototype.toString.call(v);
    } catch (e2) {
      return '[unserializable]';
    }
  }
}

function send(type, args) {
  const list = [];
  for (let i = 0; i < args.length; i++) list.push(stringify(args[i]));
  writeLine(JSON.stringify({ __sandbox: true, secret: SECRET, type: type, args: list }));
}

process.on('uncaughtException', function (e) {
  send('error', ['Uncaught ' + stringify(e)]);
});
process.on('unhandledRejection', function (reason) {
  send('error', ['Unhandled rejection: ' + stringify(reason)]);
});

const sandbox = {};
const guestConsole = {};
for (const kind of ['log', 'info', 'warn', 'error']) {
  guestConsole[kind] = function () { send(kind, arguments); };
}
guestConsole.debug = guestConsole.log;
guestConsole.trace = guestConsole.log;
sandbox.console = guestConsole;
for (const name of ['setTimeout', 'clearTimeout', 'setInterval', 'clearInterval',
                    'setImmediate', 'clearImmediate', 'queueMicrotask']) {
  const fn = global[name];
  sandbox[name] = function () { return fn.apply(global, arguments); };
}
const context = vm.createContext(sandbox, {
  name: 'jsbox',
  codeGeneration: { strings: true, wasm: false },
});

if (/connect-src\s+'none'/.test(POLICY)) {
  vm.runInContext(`(function () {
    function blocked(name) {
      return function () { throw new Error(name + ' is blocked by the sandbox policy'); };
    }
    for (const name of ['fetch', 'XMLHttpRequest', 'WebSocket', 'EventSource']) {
      Object.defineProperty(globalThis, name, {
        value: blocked(name), writable: false, configurable: false, enumerable: false,
      });
    }
  })();`, context);
}

const libraries = [
{{LIBRARY_SCRIPTS}}
];
for (const lib of libraries) {
  if (!lib || typeof lib !== 'object') continue;
  if (lib.error !== undefined) {
    send('error', ['Failed to load library ' + lib.name + ': ' + lib.error]);
    continue;
  }
  try {
    new vm.Script(String(lib.code), { filename: String(lib.source) }).runInContext(context);
  } catch (e) {
    send('error', ['Failed to initialize library ' + lib.name + ': ' + stringify(e)]);
  }
}

const userCode = `{{USER_CODE}}`;
try {
  new vm.Script(userCode, { filename: 'user-code.js' }).runInContext(context);
} catch (e) {
  send('error', [e]);
} finally {
  setTimeout(function () { send('done', []); }, 0);
}
)js";

struct MarkerSpec {
  const char* marker;
  const std::string* value;
};

// Name between the braces of a marker constant: "{{SECRET}}" -> "SECRET"
std::string MarkerName(const char* marker) {
  std::string str = marker;
  return str.substr(2, str.size() - 4);
}

inline bool IsBlank(char c) {
  return c == ' ' || c == '\t';
}

// If text[pos..] is "{{ NAME }}" for one of the markers, returns its index and sets *len
int MatchMarker(const std::string& text, size_t pos, const MarkerSpec* specs, int n, size_t* len) {
  if (text.compare(pos, 2, "{{") != 0) return -1;
  size_t cur = pos + 2;
  while (cur < text.size() && IsBlank(text[cur])) cur++;
  size_t name_begin = cur;
  while (cur < text.size() && (std::isupper((unsigned char)text[cur]) || text[cur] == '_')) cur++;
  std::string name = text.substr(name_begin, cur - name_begin);
  while (cur < text.size() && IsBlank(text[cur])) cur++;
  if (text.compare(cur, 2, "}}") != 0) return -1;
  for (int i = 0; i < n; i++) {
    if (name == MarkerName(specs[i].marker)) {
      *len = cur + 2 - pos;
      return i;
    }
  }
  return -1;
}

} // namespace

BootstrapTemplate::BootstrapTemplate(std::string source, Fetcher& fetcher,
                                     std::shared_ptr<spdlog::logger> logger,
                                     std::chrono::milliseconds timeout) :
    source_(std::move(source)), fetcher_(fetcher), logger_(std::move(logger)),
    timeout_(timeout), loaded_(false) {}

const std::string& BootstrapTemplate::DefaultTemplate() {
  static const std::string kText = kDefaultTemplate;
  return kText;
}

void BootstrapTemplate::Validate(const std::string& text) {
  const std::string empty;
  const MarkerSpec specs[] = {
    {kSecretMarker, &empty},
    {kUserCodeMarker, &empty},
    {kPolicyMarker, &empty},
    {kLibraryMarker, &empty},
  };
  constexpr int kSpecs = sizeof(specs) / sizeof(specs[0]);
  bool found[kSpecs] = {};
  for (size_t pos = text.find("{{"); pos != std::string::npos; pos = text.find("{{", pos + 1)) {
    size_t len;
    int idx = MatchMarker(text, pos, specs, kSpecs, &len);
    if (idx >= 0) found[idx] = true;
  }
  std::vector<std::string> missing;
  for (int i = 0; i < kSpecs; i++) {
    if (!found[i]) missing.push_back(specs[i].marker);
  }
  if (missing.size()) throw TemplateIntegrityError(std::move(missing));
}

void BootstrapTemplate::Initialize() {
  if (loaded_) return;
  if (source_.empty()) {
    logger_->info("Using built-in bootstrap template");
    text_ = DefaultTemplate();
    loaded_ = true;
    return;
  }
  logger_->info("Loading bootstrap template from {}", source_);
  FetchResult res;
  if (IsHttpUrl(source_)) {
    res = fetcher_.Fetch(source_, timeout_);
  } else {
    fs::path path = source_;
    if (source_.compare(0, sizeof(kFileScheme) - 1, kFileScheme) == 0) {
      path = source_.substr(sizeof(kFileScheme) - 1);
    }
    if (ReadFile(path, res.body)) {
      res.ok = true;
    } else {
      res.body.clear();
      res.error = "Cannot read " + path.string();
    }
  }
  if (!res.ok) {
    logger_->warn("Failed to load template from {}: {}; using built-in template", source_, res.error);
    text_ = DefaultTemplate();
    loaded_ = true;
    return;
  }
  try {
    Validate(res.body);
    text_ = std::move(res.body);
    logger_->debug("Template loaded, {} characters", text_.size());
  } catch (TemplateIntegrityError& e) {
    logger_->warn("{} in {}; using built-in template", e.what(), source_);
    text_ = DefaultTemplate();
  }
  loaded_ = true;
}

void BootstrapTemplate::ForceReload() {
  loaded_ = false;
  Initialize();
}

std::string BootstrapTemplate::Render(const std::string& user_code, const std::string& secret,
                                      const std::string& library_bundle,
                                      const std::string& policy) const {
  const std::string& text = loaded_ ? text_ : DefaultTemplate();
  const std::string code = std::string("//# sourceURL=") + kUserCodeSourceName + "\n" +
      EscapeUserCode(user_code);
  const MarkerSpec specs[] = {
    {kSecretMarker, &secret},
    {kUserCodeMarker, &code},
    {kPolicyMarker, &policy},
    {kLibraryMarker, &library_bundle},
  };
  constexpr int kSpecs = sizeof(specs) / sizeof(specs[0]);
  int replaced[kSpecs] = {};

  std::string ret;
  ret.reserve(text.size() + code.size() + library_bundle.size() + policy.size());
  size_t pos = 0;
  while (pos < text.size()) {
    size_t next = text.find("{{", pos);
    if (next == std::string::npos) {
      ret.append(text, pos, std::string::npos);
      break;
    }
    ret.append(text, pos, next - pos);
    size_t len;
    int idx = MatchMarker(text, next, specs, kSpecs, &len);
    if (idx < 0) {
      ret += text[next];
      pos = next + 1;
      continue;
    }
    ret += *specs[idx].value;
    replaced[idx]++;
    pos = next + len;
  }
  for (int i = 0; i < kSpecs; i++) {
    logger_->trace("Replaced {} x{}", specs[i].marker, replaced[i]);
  }
  logger_->debug("Rendered bootstrap program, {} characters", ret.size());
  return ret;
}

std::string EscapeUserCode(const std::string& code) {
  std::string ret;
  ret.reserve(code.size() + code.size() / 16);
  for (size_t i = 0; i < code.size(); i++) {
    char c = code[i];
    if (c == '\\' || c == '`') {
      ret += '\\';
      ret += c;
    } else if (c == '$' && i + 1 < code.size() && code[i + 1] == '{') {
      ret += "\\$";
    } else {
      ret += c;
    }
  }
  return ret;
}
