#pragma once

#include "KeyPermissionGuard.h"

// In-memory stand-in for the key file's owner and mode.
class FakeKeyFileModes : public KeyFileModes
{
public:
    uid_t    owner = 1000;
    uid_t    euid  = 1000;
    unsigned mode  = 0100644;

    bool chmodSticks = true;   // false: chmod "succeeds" but the mode stays
    int  statError   = 0;
    int  chmodError  = 0;

    int statCalls  = 0;
    int chmodCalls = 0;

    int stat(const QString&, Stat* out) override
    {
        ++statCalls;
        if (statError != 0)
            return statError;
        out->owner = owner;
        out->mode  = mode;
        return 0;
    }

    int chmod(const QString&, unsigned newMode) override
    {
        ++chmodCalls;
        if (chmodError != 0)
            return chmodError;
        if (chmodSticks)
            mode = (mode & ~0777u) | (newMode & 0777u);
        return 0;
    }

    uid_t effectiveUser() override { return euid; }
};
