#pragma once

#include <PaperspaceViewport/IReadSession.h>
#include <PaperspaceViewport/Library.h>

#include <memory>

namespace PaperspaceViewport {

/**
 * @brief The host application's store of sheet and scene records.
 */
class PAPERSPACEVIEWPORT_API IObjectStore {
public:
  virtual ~IObjectStore() = default;

  /**
   * @brief Opens a new read session. The session stays open until the
   * returned pointer is destroyed.
   */
  virtual std::unique_ptr<IReadSession> beginReadSession() = 0;
};

} // namespace PaperspaceViewport
