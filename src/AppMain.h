#pragma once

#include "CommandExecutor.h"

// 세 실행파일 공통 진입점. 종료 코드 반환
int RunNotifyApp(eMode mode, int argc, char* argv[]);
