#ifndef KVLOAD_TEST_LOAD_MOCK_STORAGE_CLIENT_H_
#define KVLOAD_TEST_LOAD_MOCK_STORAGE_CLIENT_H_

#include <gmock/gmock.h>

#include <cstdint>
#include <optional>

#include "../../src/store/in_memory_store.h"
#include "../../src/store/storage_client.h"

namespace KvLoad {

class MockStorageClient : public StorageClient {
public:
    MOCK_METHOD(absl::Status, Write, (int64_t key, const ColumnMap& columns), (override));
    MOCK_METHOD((absl::StatusOr<std::optional<ColumnMap>>), Read, (int64_t key), (override));

    // Forward every call to a real store unless a test overrides it.
    void DelegateTo(InMemoryStore* store) {
        ON_CALL(*this, Write).WillByDefault([store](int64_t key, const ColumnMap& columns) {
            return store->Write(key, columns);
        });
        ON_CALL(*this, Read).WillByDefault([store](int64_t key) {
            return store->Read(key);
        });
    }
};

}  // namespace KvLoad

#endif  // KVLOAD_TEST_LOAD_MOCK_STORAGE_CLIENT_H_
