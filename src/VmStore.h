#pragma once

#include <QString>

#include "VmHandle.h"

/*
    VmStore
    -------
    Static utility class that reads a VM descriptor (JSON) into a VmHandle.

    Responsibilities:
    - Parse the "ssh" block and the forwarded-port table of each adapter
    - Apply SshSettings defaults for anything missing
    - Resolve a relative root_path against the descriptor's directory

    Design notes:
    - Stateless; all functions are static.
    - Unknown fields are ignored on load.
    - There is no save(): the descriptor belongs to the VM model.
*/

class VmStore
{
public:
    /*
        Default descriptor: root_path = current directory, SshSettings
        defaults, no adapters (port must then be configured or discovered
        after the caller fills networkAdapters).
    */
    static VmHandle defaults();

    /*
        Load a descriptor.

        JSON format:
        {
          "root_path": "/path/to/project",        // optional
          "ssh": {
            "host": "127.0.0.1",
            "username": "vagrant",
            "private_key_path": "keys/vagrant",
            "port": 2222,                         // optional, omit to discover
            "forwarded_port_key": "ssh",
            "forwarded_port_destination": 22,
            "max_tries": 10,
            "timeout": 30,
            "forward_agent": false,
            "forward_x11": false
          },
          "network_adapters": [
            { "forwarded_ports": [ { "name": "ssh", "guest_port": 22, "host_port": 2222 } ] }
          ]
        }

        Returns false and sets err if the file cannot be read, is not a
        JSON object, or an ssh integer field (port, max_tries, timeout,
        forwarded_port_destination) holds anything but a whole number.
        out is left untouched in that case.
    */
    static bool load(const QString& path, VmHandle* out, QString* err = nullptr);

    // Same as load() but from an in-memory document; baseDir anchors a
    // relative root_path.
    static bool parse(const QByteArray& json, const QString& baseDir,
                      VmHandle* out, QString* err = nullptr);
};
