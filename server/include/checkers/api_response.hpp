/*
 * 설명: REST 응답 엔벨로프와 WS 명령 응답 프레임 생성을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <string_view>

#include <nlohmann/json.hpp>

namespace checkers {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);

// {"type": "chat.message", "message": [...]} 형식은 기존 보드 클라이언트와의 호환을 위해 유지한다.
nlohmann::json MakeCommandReply(const nlohmann::json& results);
nlohmann::json MakeCommandError(std::string_view code, std::string_view message);

}  // namespace checkers
