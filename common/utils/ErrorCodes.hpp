#pragma once

/**
 * @brief 统一错误码定义
 *
 * 错误码规则：
 * - 1xxx: 调用方错误（校验失败、违反 Result 契约等）
 * - 2xxx: 守卫规则错误（规则未注册、语法错误、重复注册）
 * - 5xxx: 内部错误（配置等）
 */
namespace ErrorCodes {

// ==================== 调用方错误 (1xxx) ====================

/** 数据验证失败 */
inline constexpr int VALIDATION_FAILED = 1005;

/** 对失败的 Result 调用 unwrap */
inline constexpr int UNWRAP_ON_ERR = 1006;

/** 对空的 Maybe 取值 */
inline constexpr int MISSING_VALUE = 1007;

// ==================== 守卫规则错误 (2xxx) ====================

/** 规则名称未注册 */
inline constexpr int UNKNOWN_GUARD = 2001;

/** 规则字符串语法错误 */
inline constexpr int MALFORMED_RULE = 2002;

/** 规则名称重复注册 */
inline constexpr int DUPLICATE_NAME = 2003;

/** 注册表已冻结 */
inline constexpr int REGISTRY_FROZEN = 2004;

// ==================== 内部错误 (5xxx) ====================

/** 配置文件错误 */
inline constexpr int CONFIG_INVALID = 5003;

}  // namespace ErrorCodes
