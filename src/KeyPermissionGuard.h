// KeyPermissionGuard.h
//
// Purpose:
//   Makes sure the private key is mode 0600 before any authentication
//   attempt. A key that cannot be brought to 0600 is a hard error.
//
// Rules:
//   - Platforms without a POSIX owner/mode model: no-op.
//   - Key owned by the effective user and mode != 600: chmod 600, re-check,
//     throw SshKeyBadPermissions if the mode did not change.
//   - Key owned by someone else: left alone, no error.
//   - EPERM/EACCES while stat-ing or chmod-ing -> SshKeyBadPermissions.
//   - Any other OS error (e.g. ENOENT) -> std::system_error.

#pragma once

#include <QString>

#include <sys/types.h>

// File-mode backend. The default one talks to the OS; tests substitute
// their own to simulate filesystems that ignore chmod.
class KeyFileModes
{
public:
    struct Stat {
        uid_t    owner = 0;
        unsigned mode  = 0;   // st_mode
    };

    virtual ~KeyFileModes() = default;

    // Return 0 or an errno value.
    virtual int stat(const QString& path, Stat* out) = 0;
    virtual int chmod(const QString& path, unsigned mode) = 0;
    virtual uid_t effectiveUser() = 0;
};

class PosixKeyFileModes : public KeyFileModes
{
public:
    int stat(const QString& path, Stat* out) override;
    int chmod(const QString& path, unsigned mode) override;
    uid_t effectiveUser() override;
};

class KeyPermissionGuard
{
public:
    // True where file ownership and mode bits mean something.
    static bool platformHasFileModes();

    KeyPermissionGuard();
    KeyPermissionGuard(KeyFileModes* modes, bool enforce);

    KeyPermissionGuard(const KeyPermissionGuard&) = delete;
    KeyPermissionGuard& operator=(const KeyPermissionGuard&) = delete;

    void ensure(const QString& keyPath);

    bool isEnforced() const { return m_enforce; }

    // Low three octal digits of a mode, e.g. 0100644 -> "644".
    static QString permsString(unsigned mode);

private:
    PosixKeyFileModes m_posix;
    KeyFileModes* m_modes = nullptr;
    bool m_enforce = true;

    KeyFileModes::Stat statOrThrow(const QString& keyPath);
};
