#include "Process.h"
#include "Logging.h"
#include <sys/types.h>
#include <sys/wait.h>
#include <sys/stat.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace sb_modsign {

std::string Command::str() const {
    std::string s;
    for(const auto& a : argv){ if(!s.empty()) s.push_back(' '); s += a; }
    return s;
}

static bool is_executable(const std::string& path){
    struct stat st{};
    if(stat(path.c_str(), &st) != 0) return false;
    return S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
}

bool ProcessRunner::available(const std::string& tool){
    if(tool.empty()) return false;
    if(tool.find('/') != std::string::npos) return is_executable(tool);
    const char* path = getenv("PATH");
    std::string p = path ? path : "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";
    size_t start = 0;
    while(start <= p.size()){
        size_t end = p.find(':', start);
        if(end == std::string::npos) end = p.size();
        std::string dir = p.substr(start, end - start);
        if(!dir.empty() && is_executable(dir + "/" + tool)) return true;
        start = end + 1;
    }
    return false;
}

CommandResult ProcessRunner::run(const Command& cmd){
    CommandResult res;
    if(cmd.argv.empty()) return res;
    Logger::instance().debug("exec: " + cmd.str());

    int pipefd[2] = {-1, -1};
    if(!cmd.interactive && pipe(pipefd) != 0){
        Logger::instance().error(std::string("pipe() failed: ") + strerror(errno));
        return res;
    }
    pid_t pid = fork();
    if(pid < 0){
        Logger::instance().error(std::string("fork() failed: ") + strerror(errno));
        if(pipefd[0] >= 0){ close(pipefd[0]); close(pipefd[1]); }
        return res;
    }
    if(pid == 0){
        if(!cmd.interactive){
            int devnull = open("/dev/null", O_RDWR);
            if(devnull >= 0){ dup2(devnull, STDIN_FILENO); dup2(devnull, STDERR_FILENO); close(devnull); }
            dup2(pipefd[1], STDOUT_FILENO);
            close(pipefd[0]); close(pipefd[1]);
        }
        for(const auto& kv : cmd.env) setenv(kv.first.c_str(), kv.second.c_str(), 1);
        std::vector<char*> argv;
        for(const auto& a : cmd.argv) argv.push_back(const_cast<char*>(a.c_str()));
        argv.push_back(nullptr);
        execvp(argv[0], argv.data());
        _exit(127); // exec failed
    }

    if(!cmd.interactive){
        close(pipefd[1]);
        char buf[4096];
        for(;;){
            ssize_t n = read(pipefd[0], buf, sizeof(buf));
            if(n > 0){ res.output.append(buf, static_cast<size_t>(n)); continue; }
            if(n < 0 && errno == EINTR) continue;
            break;
        }
        close(pipefd[0]);
    }
    int status = 0;
    pid_t w;
    do { w = waitpid(pid, &status, 0); } while(w < 0 && errno == EINTR);
    if(w < 0){
        Logger::instance().error(std::string("waitpid failed: ") + strerror(errno));
        return res;
    }
    res.started = true;
    if(WIFEXITED(status)) res.exit_code = WEXITSTATUS(status);
    else if(WIFSIGNALED(status)) res.exit_code = 128 + WTERMSIG(status);
    // 127 from the child means execvp failed: the tool is not there.
    if(res.exit_code == 127) res.started = false;
    Logger::instance().trace("exit " + std::to_string(res.exit_code) + ": " + cmd.argv[0]);
    return res;
}

}
