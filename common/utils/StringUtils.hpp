#pragma once

/**
 * @brief 字符串工具类
 */
class StringUtils {
public:
    static std::string trim(const std::string& str) {
        auto start = std::find_if_not(str.begin(), str.end(), [](unsigned char ch) {
            return std::isspace(ch);
        });
        auto end = std::find_if_not(str.rbegin(), str.rend(), [](unsigned char ch) {
            return std::isspace(ch);
        }).base();

        return (start < end) ? std::string(start, end) : std::string();
    }

    static std::string toLower(const std::string& str) {
        std::string result = str;
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        return result;
    }

    static std::string toUpper(const std::string& str) {
        std::string result = str;
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return std::toupper(c); });
        return result;
    }

    /**
     * @brief 单遍替换 {key} 占位符，未提供的占位符原样保留
     *
     * 替换进来的文本不会再被扫描，字段名或参数里出现的 "{not}" 等不会被二次替换。
     */
    static std::string substitute(const std::string& text, const std::map<std::string, std::string>& values) {
        std::string result;
        result.reserve(text.size());
        size_t pos = 0;
        while (pos < text.size()) {
            size_t open = text.find('{', pos);
            if (open == std::string::npos) break;
            size_t close = text.find('}', open + 1);
            if (close == std::string::npos) break;

            result.append(text, pos, open - pos);
            auto it = values.find(text.substr(open + 1, close - open - 1));
            if (it != values.end()) {
                result += it->second;
                pos = close + 1;
            } else {
                result += '{';
                pos = open + 1;
            }
        }
        result.append(text, pos, std::string::npos);
        return result;
    }

    /**
     * @brief UTF-8 字符数（不校验编码，按非续字节计数）
     */
    static size_t utf8Length(const std::string& str) {
        return static_cast<size_t>(std::count_if(str.begin(), str.end(), [](unsigned char c) {
            return (c & 0xC0) != 0x80;
        }));
    }

    static std::string join(const std::vector<std::string>& parts, const std::string& separator) {
        std::string result;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) result += separator;
            result += parts[i];
        }
        return result;
    }
};
