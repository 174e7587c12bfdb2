// ─── Mirrorgate — Client runtime shim template ──────────────────────────

#include "client_shim.h"

#include <cstdio>
#include <cstring>
#include <utility>

namespace {

// Placeholders are replaced by JS string literals. Every override falls
// back to the unmodified call when the URL cannot be resolved.
const char kShimTemplate[] = R"JS((function (g) {
  if (!g || g.__mirrorgate) return;
  var BASE = __MG_BASE__;
  var ORIGIN = __MG_ORIGIN__;
  var PREFIX = __MG_PREFIX__;
  var TUNNEL = __MG_TUNNEL__;

  var mg = { base: BASE, origin: ORIGIN, prefix: PREFIX, tunnel: TUNNEL };
  try {
    Object.defineProperty(g, '__mirrorgate', { value: mg, enumerable: false });
  } catch (e) {
    g.__mirrorgate = mg;
  }

  function b64url(text) {
    var bytes = unescape(encodeURIComponent(text));
    return g.btoa(bytes).replace(/\+/g, '-').replace(/\//g, '_').replace(/=+$/, '');
  }

  function proxyOrigin() {
    return g.location.origin;
  }

  function isProxied(u) {
    return u.indexOf(PREFIX) === 0 || u.indexOf(proxyOrigin() + PREFIX) === 0;
  }

  // Absolute http(s) URL object for `u`, or null when it must stay as is.
  function resolve(u) {
    if (u === null || u === undefined) return null;
    u = String(u).trim();
    if (!u || u.charAt(0) === '#') return null;
    if (/^(data|javascript|mailto|tel|blob|about):/i.test(u)) return null;
    if (isProxied(u)) return null;
    var abs = new URL(u, BASE);
    // Already resolved against the proxy origin by the browser.
    if (abs.origin === proxyOrigin()) {
      abs = new URL(abs.pathname + abs.search + abs.hash, ORIGIN);
    }
    if (abs.protocol !== 'http:' && abs.protocol !== 'https:') return null;
    return abs;
  }

  function wrap(u) {
    try {
      var abs = resolve(u);
      if (!abs) return u;
      var hash = abs.hash;
      abs.hash = '';
      return PREFIX + b64url(abs.href) + hash;
    } catch (e) {
      return u;
    }
  }
  mg.wrap = wrap;

  // ── fetch / XMLHttpRequest ──
  if (typeof g.fetch === 'function') {
    var nativeFetch = g.fetch;
    g.fetch = function (input, init) {
      try {
        if (typeof input === 'string' || (g.URL && input instanceof g.URL)) {
          input = wrap(String(input));
        } else if (g.Request && input instanceof g.Request) {
          var wrapped = wrap(input.url);
          if (wrapped !== input.url) input = new g.Request(wrapped, input);
        }
      } catch (e) {}
      return nativeFetch.call(this, input, init);
    };
  }

  if (g.XMLHttpRequest && g.XMLHttpRequest.prototype) {
    var nativeOpen = g.XMLHttpRequest.prototype.open;
    g.XMLHttpRequest.prototype.open = function (method, url) {
      var args = Array.prototype.slice.call(arguments);
      try {
        if (args.length > 1) args[1] = wrap(String(url));
      } catch (e) {}
      return nativeOpen.apply(this, args);
    };
  }

  // ── WebSocket ──
  function tunnelUrl(u) {
    try {
      var target = new URL(String(u), BASE);
      var loc = g.location;
      if (target.host === loc.host &&
          (target.pathname + target.search).indexOf(TUNNEL) === 0) {
        return u;
      }
      var scheme = target.protocol === 'wss:' ? 'https:'
                 : target.protocol === 'ws:' ? 'http:' : target.protocol;
      if (scheme !== 'http:' && scheme !== 'https:') return u;
      var httpUrl = scheme + '//' + target.host + target.pathname + target.search;
      var wsScheme = loc.protocol === 'https:' ? 'wss:' : 'ws:';
      return wsScheme + '//' + loc.host + TUNNEL + b64url(httpUrl);
    } catch (e) {
      return u;
    }
  }

  if (typeof g.WebSocket === 'function') {
    var NativeWebSocket = g.WebSocket;
    var ProxiedWebSocket = function (url, protocols) {
      var target = tunnelUrl(url);
      return protocols === undefined ? new NativeWebSocket(target)
                                     : new NativeWebSocket(target, protocols);
    };
    ProxiedWebSocket.prototype = NativeWebSocket.prototype;
    ['CONNECTING', 'OPEN', 'CLOSING', 'CLOSED'].forEach(function (k) {
      try {
        Object.defineProperty(ProxiedWebSocket, k, { value: NativeWebSocket[k] });
      } catch (e) {}
    });
    g.WebSocket = ProxiedWebSocket;
  }

  // ── Navigation (window scope only) ──
  if (typeof g.open === 'function') {
    var nativeWindowOpen = g.open;
    g.open = function (u) {
      var args = Array.prototype.slice.call(arguments);
      try {
        if (args.length > 0 && args[0]) args[0] = wrap(String(args[0]));
      } catch (e) {}
      return nativeWindowOpen.apply(g, args);
    };
  }

  var realLocation = g.location;
  if (g.document) {
    try {
      var nativeAssign = realLocation.assign;
      var nativeReplace = realLocation.replace;
      realLocation.assign = function (u) { return nativeAssign.call(realLocation, wrap(u)); };
      realLocation.replace = function (u) { return nativeReplace.call(realLocation, wrap(u)); };
    } catch (e) {}

    g.document.addEventListener('click', function (ev) {
      try {
        if (ev.defaultPrevented || ev.button !== 0) return;
        var el = ev.target;
        while (el && el.nodeName !== 'A' && el.nodeName !== 'AREA') el = el.parentNode;
        if (!el || !el.getAttribute) return;
        var raw = el.getAttribute('href');
        if (raw === null || isProxied(raw)) return;
        var dest = wrap(raw);
        if (dest === raw) return;
        ev.preventDefault();
        if (el.getAttribute('target') === '_blank' || ev.ctrlKey || ev.metaKey) {
          g.open(dest, '_blank');
        } else {
          realLocation.href = dest;
        }
      } catch (e) {}
    }, true);
  }

  // ── Stand-ins used by rewritten scripts ──
  function makeLocation() {
    var view = {};
    ['href', 'protocol', 'host', 'hostname', 'port', 'pathname', 'search',
     'hash', 'origin'].forEach(function (k) {
      Object.defineProperty(view, k, {
        enumerable: true,
        get: function () {
          try { return new URL(BASE)[k]; } catch (e) { return realLocation[k]; }
        },
        set: function (v) {
          if (k === 'hash') realLocation.hash = v;
          else if (k === 'href') realLocation.href = wrap(v);
        }
      });
    });
    view.assign = function (u) { realLocation.assign(wrap(u)); };
    view.replace = function (u) { realLocation.replace(wrap(u)); };
    view.reload = function () { realLocation.reload(); };
    view.toString = function () { return view.href; };
    return view;
  }

  mg.window = g;
  mg.document = g.document;
  mg.location = g.document ? makeLocation() : realLocation;
})(typeof window !== 'undefined' ? window : self);
)JS";

}  // namespace

std::string js_string_literal(const std::string &value) {
  std::string out = "\"";
  for (size_t i = 0; i < value.size(); ++i) {
    unsigned char ch = static_cast<unsigned char>(value[i]);
    switch (ch) {
      case '\\': out += "\\\\"; break;
      case '"':  out += "\\\""; break;
      case '\n': out += "\\n";  break;
      case '\r': out += "\\r";  break;
      case '\t': out += "\\t";  break;
      case '<':  out += "\\u003c"; break;
      default:
        if (ch < 0x20) {
          char buffer[8];
          std::snprintf(buffer, sizeof(buffer), "\\u%04x", ch);
          out += buffer;
        } else if (ch == 0xE2 && i + 2 < value.size() &&
                   static_cast<unsigned char>(value[i + 1]) == 0x80 &&
                   (static_cast<unsigned char>(value[i + 2]) == 0xA8 ||
                    static_cast<unsigned char>(value[i + 2]) == 0xA9)) {
          // U+2028 / U+2029 end a line inside JS string literals.
          out += static_cast<unsigned char>(value[i + 2]) == 0xA8 ? "\\u2028"
                                                                    : "\\u2029";
          i += 2;
        } else {
          out += static_cast<char>(ch);
        }
        break;
    }
  }
  out += "\"";
  return out;
}

std::string render_client_shim(const ShimParams &params) {
  // Single pass, so placeholder-like text inside a value is never expanded.
  const std::pair<const char *, std::string> values[] = {
      {"__MG_BASE__", js_string_literal(params.base_url)},
      {"__MG_ORIGIN__", js_string_literal(params.origin)},
      {"__MG_PREFIX__", js_string_literal(params.proxy_prefix)},
      {"__MG_TUNNEL__", js_string_literal(params.tunnel_prefix)},
  };
  const std::string shim_template = kShimTemplate;
  std::string shim;
  shim.reserve(shim_template.size() + 512);
  size_t pos = 0;
  while (pos < shim_template.size()) {
    size_t marker = shim_template.find("__MG_", pos);
    if (marker == std::string::npos) {
      shim.append(shim_template, pos, std::string::npos);
      break;
    }
    shim.append(shim_template, pos, marker - pos);
    pos = marker;
    bool replaced = false;
    for (const auto &value : values) {
      if (shim_template.compare(pos, std::strlen(value.first), value.first) == 0) {
        shim += value.second;
        pos += std::strlen(value.first);
        replaced = true;
        break;
      }
    }
    if (!replaced) {
      shim += shim_template[pos];
      ++pos;
    }
  }
  return shim;
}
