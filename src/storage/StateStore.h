#pragma once
#include "storage/AtomicFileStore.h"
#include "storage/PersistedState.h"

/**
 * @brief Load/save of the PersistedState document.
 *
 * No partial updates: callers load, mutate in memory and save the whole
 * document back.
 */
class StateStore {
public:
    explicit StateStore(fs::path stateFile);

    /**
     * @brief Returns the stored document, or version 1 with empty collections
     * when nothing has been saved yet.
     * @throws SupervisorError Io on read failure, Protocol on malformed JSON
     */
    PersistedState load() const;

    /**
     * @throws SupervisorError Io on write/rename failure, Protocol when the
     *         document cannot be serialized
     */
    void save(const PersistedState& state);

    const fs::path& path() const { return file.path(); }

private:
    AtomicFileStore file;
};
