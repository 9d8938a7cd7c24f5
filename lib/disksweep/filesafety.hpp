#ifndef FILESAFETY_HPP
#define FILESAFETY_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

/**
 * @brief Protected-path policy for the cleaner's safe mode
 *
 * All checks are static and work on absolute paths. A path is judged
 * lexically first (system locations, home directory, scan roots) and only
 * then against the live system (filesystem type, mount table), so the cheap
 * checks decide most cases.
 *
 * @see Cleaner
 */
class FileSafety {
public:
    enum class DeletionStatus {
        Allowed,
        BlockedSystemPath,
        BlockedHome,
        BlockedMountPoint,
        BlockedVirtualFS,
        BlockedOutsideScanRoots,
        WarningRemovableMedia
    };

    /**
     * @brief One line of /proc/mounts, octal escapes decoded
     */
    struct MountInfo {
        std::string device;
        std::string mountpoint;
        std::string fstype;
        bool is_removable = false;
        bool is_root = false;
    };

    /**
     * @brief Decides whether a path may be removed
     *
     * Checks run from most to least severe: system location, home
     * directory, outside the covered roots, virtual filesystem, mount point,
     * removable media. The first one that applies wins.
     *
     * @param path Absolute path to check
     * @param coveredRoots Directories the selection came from; when
     *                     non-empty, anything outside all of them is blocked
     */
    static DeletionStatus checkDeletion(const std::string& path,
                                        const std::vector<std::filesystem::path>& coveredRoots = {});

    /**
     * @brief True for Allowed and for WarningRemovableMedia
     */
    static bool isDeletionPermitted(DeletionStatus status);

    static std::string getStatusMessage(DeletionStatus status, const std::string& path);

    /**
     * @brief True for a critical directory itself or anything inside a
     *        system tree
     */
    static bool isSystemPath(const std::string& path);

    /**
     * @brief True if path is exactly $HOME
     */
    static bool isUserHome(const std::string& path);

    static bool isMountPoint(const std::string& path);

    /**
     * @brief True if path lives on procfs, sysfs or another kernel
     *        filesystem, or cannot be inspected at all
     */
    static bool isProtectedFilesystem(const std::string& path);

    /**
     * @brief True if the mount holding path is removable (USB stick, SD card)
     */
    static bool isRemovableMedia(const std::string& path);

    static bool isInsideRoots(const std::string& path,
                              const std::vector<std::filesystem::path>& roots);

    /**
     * @brief Parses /proc/mounts
     * @return Mounts in table order; empty if the table cannot be read
     */
    static std::vector<MountInfo> getMountPoints();

    /**
     * @brief The mount a path belongs to: the one with the longest
     *        mountpoint that is a component-wise prefix of path
     */
    static std::optional<MountInfo> findMount(const std::string& path,
                                              const std::vector<MountInfo>& mounts);

private:
    /** @brief Directories that may never be deleted themselves */
    static const std::unordered_set<std::string> CRITICAL_PATHS;

    /** @brief Trees whose contents may never be deleted */
    static const std::vector<std::string> SYSTEM_TREES;

    /** @brief Mountpoint prefixes that desktop systems use for removable media */
    static const std::vector<std::string> REMOVABLE_MOUNT_ROOTS;

    static std::string normalize(const std::string& path);

    static bool isMountPoint(const std::string& path, const std::vector<MountInfo>& mounts);
    static bool isRemovableMedia(const std::string& path, const std::vector<MountInfo>& mounts);

    /** @brief Reads the sysfs removable flag of a /dev block device */
    static bool isRemovableDevice(const std::string& device);
};

#endif // FILESAFETY_HPP
