#include "engine/browser.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace quest::engine;

TEST(BrowserTest, DetectBrowserTest) {
    EXPECT_EQ(detect_script_environment("document.getElementById('app').innerHTML = 'hi';"), script_environment::BROWSER);
    EXPECT_EQ(detect_script_environment("alert('hello');"), script_environment::BROWSER);
    EXPECT_EQ(detect_script_environment("const name = prompt('Your name?');"), script_environment::BROWSER);
    EXPECT_EQ(detect_script_environment("localStorage.setItem('k', 'v');"), script_environment::BROWSER);
    EXPECT_EQ(detect_script_environment("DOCUMENT.title = 'x';"), script_environment::BROWSER);
    // 控制台输出也被视为浏览器特征
    EXPECT_EQ(detect_script_environment("console.log('hello');"), script_environment::BROWSER);
}

TEST(BrowserTest, DetectNodeTest) {
    EXPECT_EQ(detect_script_environment("const fs = require('fs');"), script_environment::NODE);
    EXPECT_EQ(detect_script_environment("module.exports = { add };"), script_environment::NODE);
    EXPECT_EQ(detect_script_environment("process.stdout.write('hi');"), script_environment::NODE);
}

TEST(BrowserTest, BrowserWinsOverNodeTest) {
    EXPECT_EQ(detect_script_environment("const fs = require('fs');\nwindow.onload = main;"), script_environment::BROWSER);
}

TEST(BrowserTest, DetectVanillaTest) {
    EXPECT_EQ(detect_script_environment("const doubled = [1, 2, 3].map(v => v * 2);"), script_environment::VANILLA);
    EXPECT_EQ(detect_script_environment(""), script_environment::VANILLA);
}

TEST(BrowserTest, EnvironmentNameTest) {
    EXPECT_STREQ(get_environment_name(script_environment::BROWSER), "browser_js");
    EXPECT_STREQ(get_environment_name(script_environment::NODE), "node_js");
    EXPECT_STREQ(get_environment_name(script_environment::VANILLA), "vanilla_js");
}

TEST(BrowserTest, ShimTest) {
    string shim = browser_shim(nullopt);
    EXPECT_NE(shim.find("globalThis"), string::npos);
    EXPECT_NE(shim.find("outerHTML: ''"), string::npos);
    EXPECT_NE(shim.find("global.alert"), string::npos);
    EXPECT_NE(shim.find("global.localStorage"), string::npos);
    EXPECT_EQ(shim.find("__QUEST_FIXTURE__"), string::npos);
}

TEST(BrowserTest, ShimFixtureTest) {
    string shim = browser_shim(string("<p class=\"greeting\">it's\n</p>"));
    EXPECT_NE(shim.find(R"(outerHTML: "<p class=\"greeting\">it's\n</p>")"), string::npos);
    EXPECT_EQ(shim.find("__QUEST_FIXTURE__"), string::npos);
}
