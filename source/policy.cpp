#include <cmdgate/policy.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace cmdgate {

static std::string trim(std::string s){
  while(!s.empty() && (s.back()==' '||s.back()=='\t'||s.back()=='\r'||s.back()=='\n')) s.pop_back();
  size_t i=0; while(i<s.size() && (s[i]==' '||s[i]=='\t')) ++i; return s.substr(i);
}

static bool parse_bool(std::string v, bool defv){
  for (auto& ch: v) ch = (char)std::tolower((unsigned char)ch);
  if (v=="true" || v=="yes" || v=="on" || v=="1") return true;
  if (v=="false" || v=="no" || v=="off" || v=="0") return false;
  spdlog::warn("[policy] bad boolean '{}', keeping {}", v, defv);
  return defv;
}

static int parse_int(const std::string& v, int defv){
  try { return std::stoi(v); }
  catch (const std::exception&) {
    spdlog::warn("[policy] bad integer '{}', keeping {}", v, defv);
    return defv;
  }
}

// "npm yarn, git;docker" -> [npm, yarn, git, docker]
static void append_command_list(std::vector<std::string>& dst, const std::string& val){
  std::string cur;
  auto flush = [&]{
    if (!cur.empty() && std::find(dst.begin(), dst.end(), cur) == dst.end())
      dst.push_back(cur);
    cur.clear();
  };
  for (char c : val) {
    if (c==' '||c=='\t'||c==','||c==';') flush();
    else cur.push_back(c);
  }
  flush();
}

bool ProjectPolicy::allows(const std::string& executable) const {
  return std::find(allowed_commands.begin(), allowed_commands.end(), executable)
         != allowed_commands.end();
}

const CustomTool* ProjectPolicy::find_tool(const std::string& name) const {
  auto it = std::find_if(custom_tools.begin(), custom_tools.end(),
                         [&](const CustomTool& t){ return t.name == name; });
  return it == custom_tools.end() ? nullptr : &*it;
}

ProjectPolicy ProjectPolicy::Defaults() {
  ProjectPolicy p;
  p.allowed_commands = {
    "npm", "yarn", "pnpm", "bun",
    "git", "docker", "docker-compose",
    "prettier", "eslint", "tsc", "tslint",
    "pytest", "jest", "vitest", "mocha",
    "cargo", "rustfmt", "clippy",
    "go", "gofmt", "golint",
  };
  return p;
}

ProjectPolicy FilePolicyStore::Parse(const std::string& text) {
  ProjectPolicy p;
  enum class Section { None, Security, General, Tool } sec = Section::None;
  CustomTool* tool = nullptr;

  std::istringstream in(text);
  std::string line;
  int lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    line = trim(line);
    if (line.empty() || line[0]=='#' || line[0]==';') continue;
    if (line.front()=='[' && line.back()==']') {
      tool = nullptr;
      if (line == "[Security]") sec = Section::Security;
      else if (line == "[General]") sec = Section::General;
      else if (line == "[Tool]") {
        sec = Section::Tool;
        p.custom_tools.emplace_back();
        tool = &p.custom_tools.back();
      } else {
        spdlog::warn("[policy] line {}: unknown section {}", lineno, line);
        sec = Section::None;
      }
      continue;
    }

    auto eq = line.find('=');
    if (eq==std::string::npos) continue;
    auto key = trim(line.substr(0,eq));
    auto val = trim(line.substr(eq+1));

    if (sec == Section::Security) {
      if (key=="AllowedCommands") append_command_list(p.allowed_commands, val);

    } else if (sec == Section::General) {
      if (key=="GitAutoCommit") p.git_auto_commit = parse_bool(val, p.git_auto_commit);
      else if (key=="AutoCommitMessage") p.auto_commit_message = val;
      else if (key=="SessionTracking") p.session_tracking = parse_bool(val, p.session_tracking);
      else if (key=="MaxSessionCommits") p.max_session_commits = parse_int(val, p.max_session_commits);
      else if (key=="CommandTimeoutMs") p.command_timeout_ms = parse_int(val, p.command_timeout_ms);

    } else if (sec == Section::Tool && tool) {
      if (key=="Name") tool->name = val;
      else if (key=="Command") tool->command = val;
      else if (key=="Description") tool->description = val;
    }
  }

  // a [Tool] without Name or Command cannot be invoked
  auto bad = std::remove_if(p.custom_tools.begin(), p.custom_tools.end(),
                            [](const CustomTool& t){ return t.name.empty() || t.command.empty(); });
  if (bad != p.custom_tools.end()) {
    spdlog::warn("[policy] dropping {} incomplete [Tool] section(s)",
                 std::distance(bad, p.custom_tools.end()));
    p.custom_tools.erase(bad, p.custom_tools.end());
  }
  return p;
}

std::string FilePolicyStore::Render(const ProjectPolicy& p) {
  std::ostringstream o;
  o << "[Security]\n";
  for (const auto& c : p.allowed_commands) o << "AllowedCommands=" << c << "\n";
  o << "\n[General]\n"
    << "GitAutoCommit=" << (p.git_auto_commit ? "true" : "false") << "\n"
    << "AutoCommitMessage=" << p.auto_commit_message << "\n"
    << "SessionTracking=" << (p.session_tracking ? "true" : "false") << "\n"
    << "MaxSessionCommits=" << p.max_session_commits << "\n"
    << "CommandTimeoutMs=" << p.command_timeout_ms << "\n";
  for (const auto& t : p.custom_tools) {
    o << "\n[Tool]\n"
      << "Name=" << t.name << "\n"
      << "Command=" << t.command << "\n"
      << "Description=" << t.description << "\n";
  }
  return o.str();
}

FilePolicyStore::FilePolicyStore(fs::path file) : path_(std::move(file)) {}

ProjectPolicy FilePolicyStore::load() {
  std::ifstream in(path_);
  if (!in) {
    spdlog::debug("[policy] {} not found; using defaults", path_.string());
    return ProjectPolicy::Defaults();
  }
  std::stringstream ss; ss << in.rdbuf();
  return Parse(ss.str());
}

void FilePolicyStore::save(const ProjectPolicy& p) {
  std::error_code ec;
  if (path_.has_parent_path()) fs::create_directories(path_.parent_path(), ec);

  // the policy file is replaced atomically
  fs::path tmp = path_;
  tmp += ".tmp";
  {
    std::ofstream o(tmp, std::ios::trunc);
    if (!o) throw std::runtime_error("cannot write " + tmp.string());
    o << Render(p);
    if (!o) throw std::runtime_error("write failed: " + tmp.string());
  }
  fs::rename(tmp, path_, ec);
  if (ec) throw std::runtime_error("rename " + tmp.string() + ": " + ec.message());
  spdlog::info("[policy] saved {}", path_.string());
}

} // namespace cmdgate
