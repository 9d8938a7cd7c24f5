/**
 * @file filesafety.cpp
 * @brief Implementation of the protected-path policy
 *
 * Lexical checks use the component-wise prefix matching of FileScanner.
 * Live checks read the filesystem type with statfs() and the mount table
 * from /proc/mounts; removable devices are recognized through sysfs.
 */

#include "filesafety.hpp"
#include "filescanner.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

#include <linux/magic.h>
#include <sys/vfs.h>

namespace fs = std::filesystem;

namespace {

/**
 * @brief Decodes the octal escapes /proc/mounts uses for blanks
 *
 * A mountpoint "/media/USB DRIVE" appears as "/media/USB\040DRIVE".
 */
std::string unescapeMountField(const std::string& field) {
    std::string out;
    out.reserve(field.size());
    for (std::size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size() &&
            field[i + 1] >= '0' && field[i + 1] <= '7' &&
            field[i + 2] >= '0' && field[i + 2] <= '7' &&
            field[i + 3] >= '0' && field[i + 3] <= '7') {
            out += static_cast<char>((field[i + 1] - '0') * 64 +
                                     (field[i + 2] - '0') * 8 +
                                     (field[i + 3] - '0'));
            i += 3;
        } else {
            out += field[i];
        }
    }
    return out;
}

} // namespace

/**
 * @brief Directories that must never be deleted themselves
 *
 * /tmp, /var and /opt are listed as directories only: the files below them
 * are ordinary cleanup targets.
 */
const std::unordered_set<std::string> FileSafety::CRITICAL_PATHS = {
    "/", "/boot", "/dev", "/etc", "/lib", "/lib64",
    "/proc", "/root", "/run", "/sys", "/usr", "/var",
    "/bin", "/sbin", "/opt", "/srv", "/tmp", "/home"
};

/**
 * @brief Trees owned by the operating system or the package manager
 */
const std::vector<std::string> FileSafety::SYSTEM_TREES = {
    "/bin", "/boot", "/dev", "/etc", "/lib", "/lib32", "/lib64",
    "/proc", "/sbin", "/sys", "/usr", "/run", "/var/lib", "/snap"
};

const std::vector<std::string> FileSafety::REMOVABLE_MOUNT_ROOTS = {
    "/media", "/mnt", "/run/media"
};

std::string FileSafety::normalize(const std::string& path) {
    std::string normalized = fs::path(path).lexically_normal().string();
    while (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }
    return normalized;
}

FileSafety::DeletionStatus FileSafety::checkDeletion(const std::string& path,
                                                     const std::vector<fs::path>& coveredRoots) {
    const std::string normalized = normalize(path);

    if (isSystemPath(normalized)) {
        return DeletionStatus::BlockedSystemPath;
    }
    if (isUserHome(normalized)) {
        return DeletionStatus::BlockedHome;
    }
    if (!coveredRoots.empty() && !isInsideRoots(normalized, coveredRoots)) {
        return DeletionStatus::BlockedOutsideScanRoots;
    }
    if (isProtectedFilesystem(normalized)) {
        return DeletionStatus::BlockedVirtualFS;
    }

    // One read of the mount table serves both remaining checks
    const auto mounts = getMountPoints();
    if (isMountPoint(normalized, mounts)) {
        return DeletionStatus::BlockedMountPoint;
    }
    if (isRemovableMedia(normalized, mounts)) {
        return DeletionStatus::WarningRemovableMedia;
    }

    return DeletionStatus::Allowed;
}

bool FileSafety::isDeletionPermitted(DeletionStatus status) {
    return status == DeletionStatus::Allowed ||
           status == DeletionStatus::WarningRemovableMedia;
}

std::string FileSafety::getStatusMessage(DeletionStatus status, const std::string& path) {
    switch (status) {
        case DeletionStatus::Allowed:
            return "Deletion allowed";
        case DeletionStatus::BlockedSystemPath:
            return "Refusing to delete system path: " + path;
        case DeletionStatus::BlockedHome:
            return "Refusing to delete the home directory: " + path;
        case DeletionStatus::BlockedMountPoint:
            return "Refusing to delete a mount point: " + path;
        case DeletionStatus::BlockedVirtualFS:
            return "Refusing to delete on a virtual or unreadable filesystem: " + path;
        case DeletionStatus::BlockedOutsideScanRoots:
            return "Path is outside the scanned directories: " + path;
        case DeletionStatus::WarningRemovableMedia:
            return "Path is on removable media: " + path;
    }
    return "Unknown status";
}

bool FileSafety::isSystemPath(const std::string& path) {
    const std::string normalized = normalize(path);
    if (CRITICAL_PATHS.count(normalized) > 0) {
        return true;
    }
    for (const auto& tree : SYSTEM_TREES) {
        if (FileScanner::isUnderPrefix(normalized, tree)) {
            return true;
        }
    }
    return false;
}

bool FileSafety::isUserHome(const std::string& path) {
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        return false;
    }
    return normalize(path) == normalize(home);
}

bool FileSafety::isMountPoint(const std::string& path) {
    return isMountPoint(normalize(path), getMountPoints());
}

bool FileSafety::isMountPoint(const std::string& path, const std::vector<MountInfo>& mounts) {
    for (const auto& mount : mounts) {
        if (mount.mountpoint == path) {
            return true;
        }
    }
    return false;
}

/**
 * @brief Checks the filesystem type with statfs()
 *
 * tmpfs and ramfs are not listed: /tmp is often a tmpfs and holds the
 * files a cleanup is after.
 *
 * @note A path statfs() cannot inspect counts as protected
 */
bool FileSafety::isProtectedFilesystem(const std::string& path) {
    struct statfs info;
    if (::statfs(path.c_str(), &info) != 0) {
        return true;
    }

    static const long KERNEL_FILESYSTEMS[] = {
        PROC_SUPER_MAGIC,
        SYSFS_MAGIC,
        DEVPTS_SUPER_MAGIC,
        SECURITYFS_MAGIC,
        CGROUP_SUPER_MAGIC,
        CGROUP2_SUPER_MAGIC,
        DEBUGFS_MAGIC,
    };

    for (long magic : KERNEL_FILESYSTEMS) {
        if (static_cast<long>(info.f_type) == magic) {
            return true;
        }
    }
    return false;
}

bool FileSafety::isRemovableMedia(const std::string& path) {
    return isRemovableMedia(normalize(path), getMountPoints());
}

bool FileSafety::isRemovableMedia(const std::string& path, const std::vector<MountInfo>& mounts) {
    auto mount = findMount(path, mounts);
    if (!mount || mount->is_root) {
        return false;
    }
    return mount->is_removable || isRemovableDevice(mount->device);
}

/**
 * @brief Looks up the removable flag of the disk behind a device node
 *
 * Partitions (/dev/sdb1, /dev/mmcblk0p1, /dev/nvme0n1p2) carry no flag of
 * their own; their sysfs entry sits inside the parent disk's directory, so
 * the parent is read instead.
 */
bool FileSafety::isRemovableDevice(const std::string& device) {
    if (device.compare(0, 5, "/dev/") != 0) {
        return false;
    }

    std::error_code ec;
    fs::path entry = fs::path("/sys/class/block") / fs::path(device).filename();
    fs::path disk = fs::canonical(entry, ec);
    if (ec) {
        return false;
    }
    if (fs::exists(disk / "partition", ec)) {
        disk = disk.parent_path();
    }

    std::ifstream flag(disk / "removable");
    int removable = 0;
    return flag >> removable && removable == 1;
}

bool FileSafety::isInsideRoots(const std::string& path,
                               const std::vector<fs::path>& roots) {
    for (const auto& root : roots) {
        if (FileScanner::isUnderPrefix(path, root.lexically_normal())) {
            return true;
        }
    }
    return false;
}

std::vector<FileSafety::MountInfo> FileSafety::getMountPoints() {
    std::vector<MountInfo> mounts;
    std::ifstream table("/proc/mounts");
    if (!table) {
        return mounts;
    }

    std::string line;
    while (std::getline(table, line)) {
        std::istringstream fields(line);
        std::string device, mountpoint, fstype;
        if (!(fields >> device >> mountpoint >> fstype)) {
            continue;
        }

        MountInfo info;
        info.device = unescapeMountField(device);
        info.mountpoint = unescapeMountField(mountpoint);
        info.fstype = fstype;
        info.is_root = info.mountpoint == "/";
        for (const auto& prefix : REMOVABLE_MOUNT_ROOTS) {
            if (FileScanner::isUnderPrefix(info.mountpoint, prefix)) {
                info.is_removable = true;
            }
        }
        mounts.push_back(std::move(info));
    }
    return mounts;
}

std::optional<FileSafety::MountInfo> FileSafety::findMount(const std::string& path,
                                                           const std::vector<MountInfo>& mounts) {
    std::optional<MountInfo> best;
    for (const auto& mount : mounts) {
        if (!FileScanner::isUnderPrefix(path, mount.mountpoint)) {
            continue;
        }
        // Later entries with the same mountpoint shadow earlier ones
        if (!best || mount.mountpoint.size() >= best->mountpoint.size()) {
            best = mount;
        }
    }
    return best;
}
