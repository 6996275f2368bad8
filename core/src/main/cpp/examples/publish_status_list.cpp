/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#include <iostream>
#include <string>
#include "../src/errors.h"
#include "../src/persistence/memory_store.h"
#include "../src/status/definition_registry.h"
#include "../src/status/shard_allocator.h"
#include "../src/status/publisher.h"
#include "../src/util/log.h"

using namespace statuslist;
using namespace statuslist::status;
using namespace std;

// usage: publish_status_list <data_dir> [publish_dir] [count]
int main(int argc, char** argv) {
    initLoggingFromEnv();

    if (argc < 2) {
        cerr << "usage: " << argv[0] << " <data_dir> [publish_dir] [count]\n";
        return 2;
    }
    const string data_dir = argv[1];
    const string publish_dir = argc > 2 ? argv[2] : data_dir + "/published";
    const int count = argc > 3 ? stoi(argv[3]) : 10;

    StatusListConfig config = StatusListConfig::defaults();
    if (!config.validate()) {
        cerr << "invalid STATUSLIST_* configuration\n";
        return 2;
    }

    try {
        persist::MemoryStore store;
        if (store.load_snapshot(data_dir)) {
            cout << "Loaded existing records from " << persist::MemoryStore::snapshot_path(data_dir) << "\n";
        }

        DefinitionRegistry registry(store, config);
        ShardAllocator allocator(store, config);

        // reuse the first revocation definition, if any
        auto existing = registry.list(StatusPurpose::Revocation);
        Definition definition = existing.empty()
            ? registry.create(StatusPurpose::Revocation, 1)
            : existing.front();
        cout << "Definition " << definition.id << " (list_size=" << definition.list_size << ")\n";

        for (int i = 0; i < count; i++) {
            Allocation a = allocator.allocate(definition.id);
            cout << "  credential " << i << " -> " << a.shard_id << " #" << a.bit_index << "\n";
            if (i % 3 == 0) {
                allocator.update_status(a.shard_id, a.bit_index, 1);
            }
        }

        UnsecuredJwtSigner signer;
        FileSystemSink sink;
        Publisher publisher(store, signer, sink, config);

        for (const char* format : {"ietf", "w3c"}) {
            PublishReport report = publisher.publish(definition.id, format, "did:example:issuer", publish_dir);
            for (const auto& s : report.shards) {
                cout << "  " << format << " sequence " << s.sequence << ": "
                     << (s.written ? s.uri : (s.error.empty() ? s.warning : s.error)) << "\n";
            }
        }

        store.save_snapshot(data_dir);
        cout << "Saved " << store.stats().records << " records\n";
    } catch (const StatusListError& e) {
        cerr << "error (" << e.status_code() << "): " << describe(e) << "\n";
        return 1;
    }
    return 0;
}
