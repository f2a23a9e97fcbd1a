/*
 * 설명: 팝업 창에 보여줄 성공/실패 HTML 문서를 만든다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/unit/html_page_test.cpp
 */
#pragma once

#include <string>
#include <string_view>

namespace broker {

std::string EscapeHtml(std::string_view text);
// <script> 안에 넣을 수 있는 JSON 문자열 리터럴로 만든다.
std::string ToScriptLiteral(const std::string& value);

std::string RenderFailurePage(const std::string& message, const std::string& retry_url = {});
std::string RenderSuccessPage(const std::string& access_token, const std::string& frontend_origin);

}  // namespace broker
