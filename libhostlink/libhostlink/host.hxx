#pragma once

#include <libhostlink/types.hxx>

#include <libhostlink/export.hxx>

// Contracts the extension needs from the host application. Everything here is
// implemented by the host integration layer (and by fakes in tests); the core
// never constructs these objects itself.
//
namespace hostlink
{
  // Host notifications the extension may attach to.
  //
  enum class host_event
  {
    view_activating,
    view_activated,
    document_opened,
    document_closing,
    document_closed,
    idling
  };

  constexpr size_t host_event_count (6);

  LIBHOSTLINK_SYMEXPORT const char*
  to_string (host_event);

  // Opaque host identities. Zero means "none".
  //
  using document_handle = uint64_t;
  using view_handle = uint64_t;

  struct event_args
  {
    host_event event;
    document_handle document = 0;
    view_handle view = 0;
  };

  using event_handler = function<void (const event_args&)>;

  // Handle returned by the host for an attached handler.
  //
  using connection = uint64_t;

  // Opaque identity of a host-owned element.
  //
  class resource_id
  {
  public:
    constexpr
    resource_id () = default;

    constexpr explicit
    resource_id (int64_t v)
      : value_ (v)
    {
    }

    static constexpr resource_id
    invalid ()
    {
      return resource_id ();
    }

    constexpr bool
    valid () const
    {
      return value_ != invalid_value;
    }

    constexpr int64_t
    value () const
    {
      return value_;
    }

    friend constexpr bool
    operator== (resource_id x, resource_id y)
    {
      return x.value_ == y.value_;
    }

  private:
    static constexpr int64_t invalid_value = -1;

    int64_t value_ = invalid_value;
  };

  // Host transaction scope. Destroying an uncommitted transaction rolls it
  // back.
  //
  class LIBHOSTLINK_SYMEXPORT transaction
  {
  public:
    virtual
    ~transaction ();

    virtual void
    commit () = 0;
  };

  class LIBHOSTLINK_SYMEXPORT document
  {
  public:
    virtual
    ~document ();

    virtual document_handle
    handle () const = 0;

    virtual unique_ptr<transaction>
    start_transaction (const string& name) = 0;

    // Delete an element. Must be called inside a transaction.
    //
    virtual void
    erase (resource_id) = 0;
  };

  class LIBHOSTLINK_SYMEXPORT host_application
  {
  public:
    virtual
    ~host_application ();

    virtual connection
    connect (host_event, event_handler) = 0;

    virtual void
    disconnect (connection) = 0;

    // Currently active document or nullptr.
    //
    virtual document*
    active_document () = 0;

    // Show a blocking message to the user.
    //
    virtual void
    show_message (const string&) = 0;

    // Product name and release, for example "Autodesk Revit 2015".
    //
    virtual string
    version_name () const = 0;
  };

  // Context string the core model uses to select host-specific behavior:
  // the version name without the vendor and discipline words. The yearless
  // "Vasari" maps to "Vasari 2014".
  //
  LIBHOSTLINK_SYMEXPORT string
  host_context (const string& version_name);

  // The ribbon button (or command) that invokes the entry point.
  //
  class LIBHOSTLINK_SYMEXPORT command_button
  {
  public:
    virtual
    ~command_button ();

    virtual void
    enable (bool) = 0;

    virtual bool
    enabled () const = 0;
  };

  class LIBHOSTLINK_SYMEXPORT telemetry
  {
  public:
    virtual
    ~telemetry ();

    virtual void
    log_exception (const string& what) = 0;

    virtual void
    notify_crash (uint64_t fingerprint) = 0;
  };
}
