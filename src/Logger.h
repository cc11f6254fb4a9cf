#pragma once

#include "config_manager.h"

// stderr(warn 이상) 로거. 설정을 읽기 전에 사용
void InitConsoleLogger();

// root 이면 회전 파일 로그, 아니면 stderr(warn 이상)로 기본 로거 설정
void InitLogger(const NotifyConfig& config);
