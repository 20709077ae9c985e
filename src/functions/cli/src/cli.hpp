#pragma once
#include <iosfwd>
#include <string>
#include <vector>

// docx2chapter 명령 한 번 실행.
// args 는 argv[1..], fallback_config 는 --config 가 없을 때 찾아볼 .env 경로.
// JSON 을 out 으로 낼 때 진행 로그는 err 로 감
// 반환: 0 전부 성공, 1 사용법 오류, 2 치명적 오류, 3 일부 파일 실패
int run_cli(const std::vector<std::string>& args,
            const std::string& fallback_config,
            std::ostream& out,
            std::ostream& err);
