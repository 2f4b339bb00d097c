#include "tool.hpp"
#include "config.hpp"
#include "tools/file_read.hpp"
#include "tools/file_write.hpp"
#include "tools/file_edit.hpp"
#include "tools/glob_search.hpp"
#include "tools/grep_search.hpp"
#include "tools/shell.hpp"
#include <algorithm>

namespace toolgate {

std::vector<std::unique_ptr<Tool>> create_builtin_tools(const PathGuard& guard,
                                                        const SandboxConfig& sandbox) {
    // Background logs may hold many bash_output reads before they are emptied.
    auto background = std::make_shared<BackgroundProcessTable>(
        sandbox.max_background_processes,
        std::max<size_t>(size_t{64} * sandbox.max_output_bytes, 64 * 1024));

    std::vector<std::unique_ptr<Tool>> tools;
    tools.push_back(std::make_unique<FileReadTool>(guard, sandbox.max_read_bytes));
    tools.push_back(std::make_unique<FileWriteTool>(guard));
    tools.push_back(std::make_unique<FileEditTool>(guard));
    tools.push_back(std::make_unique<GlobSearchTool>(guard, sandbox.max_glob_results));
    tools.push_back(std::make_unique<GrepSearchTool>(guard, sandbox));
    tools.push_back(std::make_unique<ShellTool>(guard, sandbox, background));
    tools.push_back(std::make_unique<ShellOutputTool>(background, sandbox.max_output_bytes));
    tools.push_back(std::make_unique<ShellKillTool>(background));
    return tools;
}

} // namespace toolgate
