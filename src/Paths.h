#pragma once

// 설정 파일 (YAML)
#define PATH_CONFIG               "/etc/notify-send-all/config.yaml"

// 로그 파일 기본 경로
#define PATH_LOG                  "/var/log/notify-send-all.log"

// 사용자별 런타임 디렉토리 (/run/user/<uid>/bus 가 세션 버스 소켓)
#define PATH_RUNTIME_BASE         "/run/user"

// 로그인 기록 (who 가 읽는 파일)
#define PATH_UTMP                 "/var/run/utmp"

// 알림 클라이언트 실행 시 고정 PATH. 호출자의 PATH는 상속하지 않음
#define PATH_SAFE_SEARCH          "/usr/bin:/bin"

// 자기 자신 재실행 시 사용하는 실행파일 링크
#define PATH_SELF_EXE             "/proc/self/exe"
