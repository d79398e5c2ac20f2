/**
 * @file paranoia_drive_session.hh
 * @brief Verified-read drive session
 * @ingroup paranoia_backend
 */

#ifndef CDDA_PARANOIA_DRIVE_SESSION_HH
#define CDDA_PARANOIA_DRIVE_SESSION_HH

#include "cdio_drive_session.hh"
#include "paranoia.hh"
#include "export_cdda_backend_paranoia.h"

namespace cdda {

/**
 * @class paranoia_drive_session
 * @brief cdio_drive_session whose reads go through cdparanoia
 * @ingroup paranoia_backend
 *
 * Paranoia reads one sector at a time from an internal cursor. The
 * session only repositions the cursor when a read does not continue where
 * the previous one stopped, so sequential streaming keeps paranoia's
 * overlap cache warm.
 */
class CDDA_BACKEND_PARANOIA_EXPORT paranoia_drive_session : public cdio_drive_session {
public:
    /// Takes ownership of @p cdio; throws no_drive_error if cdparanoia rejects the drive
    explicit paranoia_drive_session(CdIo_t* cdio);
    ~paranoia_drive_session() override;

    int drive_type() const override;
    int interface_type() const override;

    bool supports_correction() const override { return true; }
    void set_correction_mode(int flags) override;
    void set_search_overlap(int sectors) override;
    void set_max_retries(int retries) override;

    /**
     * @brief Retry bound handed to cdio_paranoia_read_limited()
     * @param retries As for set_max_retries(): 0 selects the default,
     *        negative disables retries
     */
    static int retry_limit(int retries) noexcept;

protected:
    void do_read_sectors(lsn_t start, uint32_t count, void* out) override;
    void release_reader() override;

private:
    cdrom_drive_t* m_drive = nullptr;
    cdrom_paranoia_t* m_paranoia = nullptr;
    lsn_t m_cursor = -1;            // next sector paranoia will return, -1 if unknown
    int m_max_retries = default_max_retries;
};

} // namespace cdda

#endif // CDDA_PARANOIA_DRIVE_SESSION_HH
