/*
 * 설명: 성공(postMessage) 문서와 실패 문서를 렌더링한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/unit/html_page_test.cpp
 */
#include "broker/html_page.hpp"

#include <nlohmann/json.hpp>

namespace broker {

namespace {
constexpr const char* kPageHead = R"(<!DOCTYPE html>
<html>
<head>
  <meta charset="utf-8">
  <title>)";

constexpr const char* kBaseStyle = R"(</title>
  <style>
    body {
      font-family: -apple-system, BlinkMacSystemFont, 'Segoe UI', Roboto, sans-serif;
      display: flex;
      align-items: center;
      justify-content: center;
      height: 100vh;
      margin: 0;
    }
    .container {
      text-align: center;
      background: white;
      padding: 2rem;
      border-radius: 10px;
    }
    h1 { color: #1f2937; margin: 0 0 0.5rem; }
    p { color: #6b7280; margin: 0 0 1rem; }
)";

constexpr const char* kSuccessStyle = R"(    body { background: linear-gradient(135deg, #667eea 0%, #764ba2 100%); }
    .container { box-shadow: 0 20px 60px rgba(0,0,0,0.1); }
    .icon { color: #10b981; font-size: 3rem; }
  </style>
</head>
)";

constexpr const char* kFailureStyle = R"(    body { background: #f3f4f6; }
    .container { box-shadow: 0 10px 40px rgba(0,0,0,0.1); }
    .icon { color: #ef4444; font-size: 3rem; }
    button, a.retry {
      background: #3b82f6;
      color: white;
      border: none;
      padding: 0.75rem 1.5rem;
      border-radius: 6px;
      font-size: 1rem;
      cursor: pointer;
      text-decoration: none;
      margin: 0 0.25rem;
    }
  </style>
</head>
)";

constexpr int kCloseDelayMs = 2000;

void ReplaceAll(std::string& text, const std::string& from, const std::string& to) {
  std::size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
}

// ensure_ascii로 U+2028/U+2029를 포함한 비ASCII 문자는 모두 \u 이스케이프된다.
std::string DumpForScript(const nlohmann::json& value) {
  auto text = value.dump(-1, ' ', true, nlohmann::json::error_handler_t::replace);
  ReplaceAll(text, "<", "\\u003c");
  ReplaceAll(text, ">", "\\u003e");
  ReplaceAll(text, "&", "\\u0026");
  return text;
}
}  // namespace

std::string EscapeHtml(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += "&quot;";
        break;
      case '\'':
        out += "&#39;";
        break;
      default:
        out.push_back(c);
    }
  }
  return out;
}

std::string ToScriptLiteral(const std::string& value) { return DumpForScript(nlohmann::json(value)); }

std::string RenderFailurePage(const std::string& message, const std::string& retry_url) {
  std::string html = kPageHead;
  html += "OAuth Error";
  html += kBaseStyle;
  html += kFailureStyle;
  html += "<body>\n  <div class=\"container\">\n";
  html += "    <div class=\"icon\">&#9888;</div>\n";
  html += "    <h1>Authentication Failed</h1>\n";
  html += "    <p class=\"message\">" + EscapeHtml(message) + "</p>\n";
  if (!retry_url.empty()) {
    html += "    <a class=\"retry\" href=\"" + EscapeHtml(retry_url) + "\">Try Again</a>\n";
  }
  html += "    <button onclick=\"window.close()\">Close Window</button>\n";
  html += "  </div>\n</body>\n</html>\n";
  return html;
}

std::string RenderSuccessPage(const std::string& access_token, const std::string& frontend_origin) {
  auto payload = DumpForScript(nlohmann::json{{"source", "oauth"}, {"access_token", access_token}});

  std::string html = kPageHead;
  html += "OAuth Success";
  html += kBaseStyle;
  html += kSuccessStyle;
  html += "<body>\n  <div class=\"container\">\n";
  html += "    <div class=\"icon\">&#10004;</div>\n";
  html += "    <h1>Authentication Successful!</h1>\n";
  html += "    <p>You can now close this window.</p>\n";
  html += "  </div>\n  <script>\n";
  html += "    if (window.opener) {\n";
  html += "      window.opener.postMessage(" + payload + ", " + ToScriptLiteral(frontend_origin) + ");\n";
  html += "    }\n";
  html += "    setTimeout(function () { window.close(); }, " + std::to_string(kCloseDelayMs) + ");\n";
  html += "  </script>\n</body>\n</html>\n";
  return html;
}

}  // namespace broker
