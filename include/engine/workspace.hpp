#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace quest::engine {

/**
 * @brief 正在使用的工作目录集合，清理孤儿目录时跳过这些目录
 */
struct active_workspaces {
    void add(const std::filesystem::path &dir);
    void remove(const std::filesystem::path &dir);
    bool contains(const std::filesystem::path &dir) const;
    std::size_t size() const;

private:
    mutable std::mutex mut;
    std::set<std::filesystem::path> dirs;
};

/**
 * @brief 一次执行独占的工作目录
 * 工作目录只能移动不能复制，在 close 或者析构时递归删除。
 * 删除失败只记录日志，不会抛出异常。
 */
struct workspace {
    workspace();
    workspace(std::filesystem::path dir, std::shared_ptr<active_workspaces> registry);
    workspace(workspace &&other) noexcept;
    workspace(const workspace &) = delete;
    ~workspace();

    workspace &operator=(workspace &&other) noexcept;
    workspace &operator=(const workspace &) = delete;

    const std::filesystem::path &root() const;

    bool is_open() const;

    /**
     * @brief 计算工作目录下文件的绝对路径
     * @throw invalid_request filename 会逃逸出工作目录
     */
    std::filesystem::path resolve(const std::string &filename) const;

    /**
     * @brief 在工作目录中写入文件，必要时创建父文件夹
     * @param filename 相对于工作目录的文件名
     * @param content 文件内容
     * @return 文件的绝对路径
     * @throw invalid_request filename 会逃逸出工作目录
     * @throw std::system_error 文件无法写入
     */
    std::filesystem::path write(const std::string &filename, const std::string &content);

    /**
     * @brief 删除工作目录，可以重复调用
     */
    void close() noexcept;

private:
    std::filesystem::path dir;
    std::shared_ptr<active_workspaces> registry;
};

/**
 * @brief 工作目录管理器
 * 负责为每次执行分配名字唯一的工作目录，并定期清理异常退出时遗留的孤儿目录。
 */
struct workspace_manager {
    explicit workspace_manager(std::filesystem::path root);
    ~workspace_manager();

    const std::filesystem::path &root() const;

    /**
     * @brief 创建一个新的工作目录 root/quest-<uuid>
     * @throw internal_error 无法创建工作目录
     */
    workspace open();

    /**
     * @brief 删除根目录下超过 max_age 没有修改且不在使用中的工作目录
     * @return 删除的工作目录数量
     */
    std::size_t sweep_orphans(std::chrono::seconds max_age);

    /**
     * @brief 启动后台清理线程，每隔 interval 调用一次 sweep_orphans
     */
    void start_sweeper(std::chrono::seconds interval, std::chrono::seconds max_age);

    void stop_sweeper();

    std::size_t active_count() const;

private:
    std::filesystem::path root_dir;
    std::shared_ptr<active_workspaces> active;

    std::thread sweeper;
    std::mutex sweeper_mutex;
    std::condition_variable sweeper_cond;
    bool stopping = false;
};

}  // namespace quest::engine
