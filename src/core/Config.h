#pragma once
#include <string>
#include <vector>

namespace sb_modsign {

struct Config {
    // Key material
    std::string mok_dir = "/var/lib/shim-signed/mok";
    std::string mok_subject_cn = "NVIDIA Secure Boot MOK";
    int mok_validity_days = 36500;
    int mok_key_bits = 2048;
    // Target kernel; filled from uname(2) when empty
    std::string kernel_version;
    std::string arch;
    // Filesystem roots (overridable so components can run against synthetic trees)
    std::string modules_root = "/lib/modules";
    std::string headers_root = "/usr/src";
    std::string dkms_root = "/var/lib/dkms";
    std::string dkms_config = "/etc/dkms/framework.conf";
    std::string xorg_log = "/var/log/Xorg.0.log";
    std::string temp_dir = "/tmp";
    // Driver identity
    std::string driver_name = "nvidia"; // DKMS module name
    std::string driver_package = "nvidia-driver";
    std::vector<std::string> module_names = {"nvidia", "nvidia-modeset", "nvidia-drm", "nvidia-uvm", "nvidia-peermem"};
    std::vector<std::string> version_probe_modules = {"nvidia", "nvidia-modeset"};
    std::string resign_glob_prefix = "nvidia"; // re-sign helper matches <prefix>*.ko*
    std::string enroll_marker = "NVIDIA"; // substring in mokutil --list-enrolled
    std::string resign_helper_path = "/usr/local/bin/nvidia-secure-boot-resign";
    // Behaviour
    bool install_packages = true;
    bool strict = false; // exit non-zero if any module was not signed
    bool assume_yes = false; // never prompt; reuse existing keys
    bool color = true;
    bool resign = false;

    std::string mok_priv() const { return mok_dir + "/MOK.priv"; }
    std::string mok_der() const { return mok_dir + "/MOK.der"; }
    std::string mok_pem() const { return mok_dir + "/MOK.pem"; }
    std::string kernel_modules_dir() const { return modules_root + "/" + kernel_version; }
    std::string dkms_driver_dir() const { return dkms_root + "/" + driver_name; }
};

Config& config();
void set_config(const Config& c);

// Fill kernel_version / arch from uname(2) where unset.
void fill_system_defaults(Config& c);

}
