// 预编译头文件 (PCH)
// 仅包含稳定的标准库和第三方库头文件
// 不包含项目内部头文件（变化频繁会导致 PCH 频繁重建）
#pragma once

// ==================== C++ 标准库 ====================

// 容器
#include <string>
#include <vector>
#include <map>
#include <set>
#include <unordered_map>

// 工具
#include <functional>
#include <optional>
#include <variant>
#include <memory>
#include <chrono>
#include <mutex>
#include <shared_mutex>
#include <atomic>
#include <typeindex>
#include <typeinfo>
#include <type_traits>
#include <concepts>

// IO / 格式化
#include <sstream>
#include <iomanip>
#include <iostream>
#include <fstream>
#include <filesystem>

// 其他
#include <cstdint>
#include <cstdlib>
#include <cstdio>
#include <cstring>
#include <cmath>
#include <algorithm>
#include <utility>
#include <cctype>
#include <exception>
#include <stdexcept>
#include <regex>

// ==================== Trantor 日志 ====================

#include <trantor/utils/Logger.h>
#include <trantor/utils/AsyncFileLogger.h>

// ==================== 第三方库 ====================

#include <json/json.h>
