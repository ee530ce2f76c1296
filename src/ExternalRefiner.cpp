#include "ponifit/ExternalRefiner.hpp"
#include "ponifit/Errors.hpp"
#include "ponifit/RingResiduals.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <utility>
#include <vector>
#include <stdlib.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace ponifit {
namespace {

/* ------------------------------------------------------------------ */
/*  Temporary file that is removed when the owner goes out of scope   */
/* ------------------------------------------------------------------ */
class TempFile {
public:
    TempFile()
    {
        std::string tmpl = (fs::temp_directory_path() / "ponifit_XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        const int fd = ::mkstemp(buf.data());
        if (fd < 0)
            throw ExternalToolError(std::string("cannot create temporary file: ") +
                                    std::strerror(errno));
        ::close(fd);
        path_ = buf.data();
    }
    ~TempFile()
    {
        std::error_code ec;
        fs::remove(path_, ec);
    }
    TempFile(const TempFile&)            = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/* ------------------------------------------------------------------ */
/*  Read end of a child process' stdout                               */
/* ------------------------------------------------------------------ */
class ProcessPipe {
public:
    explicit ProcessPipe(const std::string& command)
        : fp_(::popen(command.c_str(), "r"))
    {
        if (!fp_)
            throw ExternalToolError("cannot start '" + command + "': " +
                                    std::strerror(errno));
    }
    ~ProcessPipe()
    {
        if (fp_) ::pclose(fp_);
    }
    ProcessPipe(const ProcessPipe&)            = delete;
    ProcessPipe& operator=(const ProcessPipe&) = delete;

    std::string read_all()
    {
        std::string out;
        char buf[4096];
        std::size_t n;
        while ((n = std::fread(buf, 1, sizeof(buf), fp_)) > 0)
            out.append(buf, n);
        return out;
    }

    /* wait for the child; returns its exit status, -1 if it did not exit */
    int close()
    {
        const int status = ::pclose(fp_);
        fp_ = nullptr;
        if (status == -1) return -1;
        return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    }

private:
    FILE* fp_;
};

std::string shell_quote(const std::string& s)
{
    std::string q = "'";
    for (char ch : s) {
        if (ch == '\'') q += "'\\''";
        else            q += ch;
    }
    q += "'";
    return q;
}

std::string fmt(double v)
{
    std::ostringstream ss;
    ss << std::setprecision(std::numeric_limits<double>::max_digits10) << v;
    return ss.str();
}

} // unnamed namespace

/* ===================================================================== */
ToolReport parse_tool_report(std::istream&         out,
                             const PoseParameters& start,
                             double                pixel1,
                             double                pixel2)
{
    ToolReport rep;
    rep.pose = start;

    std::string line;
    while (std::getline(out, line)) {
        std::istringstream ss(line);
        std::vector<std::string> word;
        std::string w;
        while (ss >> w) word.push_back(w);
        if (word.size() != 3) continue;

        double* target = nullptr;
        double  scale  = 1.0;
        if      (word[0] == "cen1") { target = &rep.pose.poni1; scale = pixel1; }
        else if (word[0] == "cen2") { target = &rep.pose.poni2; scale = pixel2; }
        else if (word[0] == "dis")  { target = &rep.pose.dist;  }
        else if (word[0] == "rot1") { target = &rep.pose.rot1;  }
        else if (word[0] == "rot2") { target = &rep.pose.rot2;  }
        else if (word[0] == "rot3") { target = &rep.pose.rot3;  }
        if (!target) continue;

        double value;
        try {
            std::size_t pos = 0;
            value = std::stod(word[1], &pos);
            if (pos != word[1].size())
                throw std::invalid_argument(word[1]);
        } catch (const std::exception&) {
            throw ExternalToolError("malformed value for '" + word[0] +
                                    "' in tool output: '" + word[1] + "'");
        }
        *target = value * scale;
        ++rep.recognised;
    }
    return rep;
}

/* ===================================================================== */
LegacyToolRefiner::LegacyToolRefiner(std::string executable, bool verbose)
    : executable_(std::move(executable)), verbose_(verbose)
{}

PoseParameters LegacyToolRefiner::refine(const PoseParameters&     pose,
                                         const CalibrationDataset& dataset,
                                         const GeometryModel&      geometry)
{
    if (!fs::exists(executable_) || ::access(executable_.c_str(), X_OK) != 0)
        throw ExternalToolError("legacy refiner '" + executable_ +
                                "' not found or not executable");

    /* ---- a) observations -> temporary file ------------------------ */
    TempFile tmp;
    {
        std::ofstream f(tmp.path());
        if (!f)
            throw ExternalToolError("cannot write '" + tmp.path() + "'");

        const auto& d_spacing = dataset.d_spacing();
        const auto  rings     = dataset.rings();
        const Matrix& data    = dataset.data();
        f << std::setprecision(std::numeric_limits<double>::max_digits10);
        for (Eigen::Index i = 0; i < data.rows(); ++i) {
            f << reference_angle(d_spacing, rings[i], pose.wavelength) << ' '
              << data(i, 0) << ' ' << data(i, 1) << '\n';
        }
        if (!f)
            throw ExternalToolError("error writing '" + tmp.path() + "'");
    }

    /* ---- b) command line ------------------------------------------ */
    const double px1 = geometry.pixel1();
    const double px2 = geometry.pixel2();
    const std::vector<std::string> args = {
        executable_, "debug=8", "maxdev=1", "input=" + tmp.path(),
        fmt(px1), fmt(px2),
        fmt(pose.poni1 / px1), fmt(pose.poni2 / px2),
        fmt(pose.dist), fmt(pose.rot1), fmt(pose.rot2), fmt(pose.rot3)
    };
    std::string cmd;
    for (const auto& a : args) {
        if (!cmd.empty()) cmd += ' ';
        cmd += shell_quote(a);
    }

    if (verbose_)
        std::cout << "[Roca] " << cmd << "\n";

    /* ---- c) run and collect stdout -------------------------------- */
    std::string output;
    int status;
    {
        ProcessPipe pipe(cmd);
        output = pipe.read_all();
        status = pipe.close();
    }
    if (status != 0)
        throw ExternalToolError("legacy refiner exited with status " +
                                std::to_string(status));

    std::istringstream in(output);
    const ToolReport rep = parse_tool_report(in, pose, px1, px2);
    if (rep.recognised == 0)
        throw ExternalToolError("legacy refiner produced no recognised output");

    if (verbose_)
        std::cout << "[Roca] " << rep.recognised << " values recognised\n";

    return rep.pose;
}

} // namespace ponifit
