/**
 * @file cdio_drive_session.hh
 * @brief Drive session over a libcdio handle
 * @ingroup cdio_backend
 */

#ifndef CDDA_CDIO_DRIVE_SESSION_HH
#define CDDA_CDIO_DRIVE_SESSION_HH

#include <cdda/sdk/drive_backend.hh>
#include "cdio.hh"
#include "export_cdda_backend_cdio.h"
#include <string>

namespace cdda {

/**
 * @class cdio_drive_session
 * @brief drive_session owning one CdIo_t handle
 * @ingroup cdio_backend
 *
 * TOC queries, speed and tray control go straight to libcdio. Reads use
 * READ CD without verification. The paranoia session derives from this
 * class and only replaces the read path.
 *
 * @note Internal class. Create sessions via drive_backend::open_session().
 */
class CDDA_BACKEND_CDIO_EXPORT cdio_drive_session : public drive_session {
public:
    /// Takes ownership of @p cdio
    explicit cdio_drive_session(CdIo_t* cdio);
    ~cdio_drive_session() override;

    std::string model() override;
    int drive_type() const override;
    int interface_type() const override;
    int track_count() override;
    lsn_t first_audio_sector() override;
    toc_t read_toc(int track_count) override;
    void set_speed(int multiplier) override;
    void eject_media() override;
    void close() override;
    bool is_open() const override;

    /**
     * @brief Throw driver_error unless @p rc is DRIVER_OP_SUCCESS
     */
    static void check(driver_return_code_t rc, const std::string& context);

    /**
     * @brief Open a handle on a drive that holds a disc
     * @param device_hint Device path; empty for the first drive found
     * @throws no_drive_error if there is no drive or no disc in it
     */
    static CdIo_t* open_handle(const std::string& device_hint);

protected:
    void do_read_sectors(lsn_t start, uint32_t count, void* out) override;

    /**
     * @brief Release anything built on top of the handle
     *
     * Called before the handle is ejected or destroyed. Derived classes
     * overriding it must also call it from their own destructor.
     */
    virtual void release_reader() {}

    [[nodiscard]] CdIo_t* handle() const { return m_cdio; }

private:
    void require_open() const;
    track_t first_track() const;

    CdIo_t* m_cdio;
};

} // namespace cdda

#endif // CDDA_CDIO_DRIVE_SESSION_HH
