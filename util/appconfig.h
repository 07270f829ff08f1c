#ifndef APPCONFIG_H
#define APPCONFIG_H

#include <QSettings>
#include <QString>

/**
 * @brief 应用配置管理类
 *
 * 负责管理：
 * - 合并/分割的默认输出位置
 * - 默认文件名规则
 * - 调试输出开关
 *
 * 使用单例模式，通过 QSettings 持久化配置
 */
class AppConfig
{
public:
    /**
     * @brief 获取单例实例
     */
    static AppConfig& instance();

    // ========== 批处理配置 ==========

    /// 进度最大值
    static constexpr int PROGRESS_MAX = 100;

    /// 合并输出的默认文件名
    static const QString DEFAULT_MERGE_FILE_NAME;

    /**
     * @brief 分割的默认文件名规则："<源文件名>_[N].pdf"
     */
    QString defaultFileNamePattern(const QString& sourcePath) const;

    /**
     * @brief 合并的默认输出路径：第一个源文件所在目录下的 merged.pdf
     */
    QString defaultMergeOutputPath(const QString& firstSourcePath) const;

    // ========== 用户偏好 ==========

    /// 上次分割的输出目录
    QString lastOutputFolder() const { return m_lastOutputFolder; }
    void setLastOutputFolder(const QString& folder);

    /// 上次合并的输出文件
    QString lastMergeOutputPath() const { return m_lastMergeOutputPath; }
    void setLastMergeOutputPath(const QString& path);

    // ========== 调试配置 ==========

    /// 是否启用调试输出（引擎逐页日志）
    bool debugMode() const { return m_debugMode; }
    void setDebugMode(bool enabled);

    /**
     * @brief 加载配置
     */
    void load();

    /**
     * @brief 保存配置
     */
    void save();

    /**
     * @brief 重置为默认配置
     */
    void resetToDefaults();

private:
    AppConfig();
    ~AppConfig();

    // 禁用拷贝
    AppConfig(const AppConfig&) = delete;
    AppConfig& operator=(const AppConfig&) = delete;

    void loadDefaults();

private:
    QSettings m_settings;

    // 用户偏好
    QString m_lastOutputFolder;
    QString m_lastMergeOutputPath;
    bool m_debugMode;
};

#endif // APPCONFIG_H
