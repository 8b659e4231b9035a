#include "engine/browser.hpp"
#include <nlohmann/json.hpp>
#include <regex>
#include <vector>

namespace quest::engine {
using namespace std;

const char *get_environment_name(script_environment env) {
    switch (env) {
        case script_environment::BROWSER: return "browser_js";
        case script_environment::NODE: return "node_js";
        case script_environment::VANILLA: return "vanilla_js";
    }
    return "vanilla_js";
}

static const vector<regex> &browser_patterns() {
    static const auto flags = regex::ECMAScript | regex::icase;
    static const vector<regex> patterns = {
        regex("\\bdocument\\.", flags),
        regex("\\bwindow\\.", flags),
        regex("\\balert\\s*\\(", flags),
        regex("\\bprompt\\s*\\(", flags),
        regex("\\bconfirm\\s*\\(", flags),
        regex("\\bconsole\\.log\\s*\\(", flags),
        regex("\\blocalStorage\\.", flags),
        regex("\\bsessionStorage\\.", flags),
        regex("\\.getElementById\\s*\\(", flags),
        regex("\\.querySelector\\s*\\(", flags),
        regex("\\.addEventListener\\s*\\(", flags),
        regex("\\bfetch\\s*\\(", flags),
        regex("<\\s*(html|body|div|script)", flags)};
    return patterns;
}

static const vector<regex> &node_patterns() {
    static const auto flags = regex::ECMAScript | regex::icase;
    static const vector<regex> patterns = {
        regex("\\brequire\\s*\\(", flags),
        regex("\\bmodule\\.exports\\b", flags),
        regex("\\bexports\\.", flags),
        regex("\\bprocess\\.", flags),
        regex("\\b__dirname\\b", flags),
        regex("\\b__filename\\b", flags),
        regex("\\bfs\\.", flags),
        regex("\\bpath\\.", flags)};
    return patterns;
}

static bool matches_any(const string &source, const vector<regex> &patterns) {
    for (auto &pattern : patterns)
        if (regex_search(source, pattern)) return true;
    return false;
}

script_environment detect_script_environment(const string &source) {
    if (matches_any(source, browser_patterns())) return script_environment::BROWSER;
    if (matches_any(source, node_patterns())) return script_environment::NODE;
    return script_environment::VANILLA;
}

static const char *SHIM = R"JS(// simulated browser environment
(function (global) {
    function element(props) {
        return Object.assign({
            innerHTML: '',
            textContent: '',
            value: '',
            style: {},
            children: [],
            appendChild: function (child) { this.children.push(child); return child; },
            addEventListener: function () {},
            removeEventListener: function () {},
            setAttribute: function () {},
            getAttribute: function () { return null; }
        }, props);
    }

    function storage(name) {
        var items = {};
        return {
            getItem: function (key) { return Object.prototype.hasOwnProperty.call(items, key) ? items[key] : null; },
            setItem: function (key, value) { items[key] = String(value); console.log(name + ' SET: ' + key + ' = ' + value); },
            removeItem: function (key) { delete items[key]; console.log(name + ' REMOVE: ' + key); },
            clear: function () { items = {}; }
        };
    }

    var document = {
        documentElement: element({ tagName: 'HTML', outerHTML: __QUEST_FIXTURE__ }),
        body: element({ tagName: 'BODY' }),
        getElementById: function (id) { return element({ id: id }); },
        querySelector: function (selector) { return element({ className: '' }); },
        querySelectorAll: function (selector) { return []; },
        createElement: function (tag) { return element({ tagName: String(tag).toUpperCase() }); },
        addEventListener: function () {}
    };

    var window = {
        document: document,
        alert: function (msg) { console.log('ALERT:', msg); },
        prompt: function (msg, defaultValue) {
            console.log('PROMPT:', msg);
            return defaultValue || 'Hello, JavaScript User!';
        },
        confirm: function (msg) {
            console.log('CONFIRM:', msg);
            return true;
        },
        localStorage: storage('LocalStorage'),
        sessionStorage: storage('SessionStorage'),
        location: { href: 'http://localhost:3000' },
        addEventListener: function () {}
    };

    global.window = window;
    global.document = document;
    global.alert = window.alert;
    global.prompt = window.prompt;
    global.confirm = window.confirm;
    global.localStorage = window.localStorage;
    global.sessionStorage = window.sessionStorage;
    global.location = window.location;
})(globalThis);

)JS";

string browser_shim(const optional<string> &html_fixture) {
    string shim(SHIM);
    // json 的字符串字面量同时也是合法的 JavaScript 字符串字面量
    string fixture = html_fixture ? nlohmann::json(*html_fixture).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) : "''";
    static const string placeholder = "__QUEST_FIXTURE__";
    shim.replace(shim.find(placeholder), placeholder.size(), fixture);
    return shim;
}

}  // namespace quest::engine
