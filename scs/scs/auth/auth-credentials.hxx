#pragma once

#include <memory>
#include <string>
#include <vector>
#include <ostream>

#include <scs/http/http-request.hxx>

namespace scs
{
  enum class credential_kind
  {
    none,
    basic,
    bearer
  };

  // Authorization to attach to a registry request. Credentials live for a
  // single transfer and are never persisted.
  //
  class credentials
  {
  public:
    virtual
    ~credentials () = default;

    virtual credential_kind
    kind () const noexcept = 0;

    // Set the Authorization header of the request.
    //
    virtual void
    apply (http_request&) const = 0;
  };

  using credentials_ptr = std::shared_ptr<const credentials>;

  // "Authorization: none", which some registries insist on even for
  // anonymous access.
  //
  class none_credentials: public credentials
  {
  public:
    credential_kind
    kind () const noexcept override
    {
      return credential_kind::none;
    }

    void
    apply (http_request&) const override;
  };

  class basic_credentials: public credentials
  {
  public:
    basic_credentials (std::string user, std::string password)
      : user_ (std::move (user)), password_ (std::move (password)) {}

    credential_kind
    kind () const noexcept override
    {
      return credential_kind::basic;
    }

    void
    apply (http_request&) const override;

    const std::string&
    user () const noexcept
    {
      return user_;
    }

  private:
    std::string user_;
    std::string password_;
  };

  class bearer_credentials: public credentials
  {
  public:
    explicit
    bearer_credentials (std::string token): token_ (std::move (token)) {}

    credential_kind
    kind () const noexcept override
    {
      return credential_kind::bearer;
    }

    void
    apply (http_request&) const override;

    const std::string&
    token () const noexcept
    {
      return token_;
    }

  private:
    std::string token_;
  };

  // Bearer credentials from an "Authorization: Bearer <token>" value, or
  // null if the value is of any other form.
  //
  credentials_ptr
  bearer_from_authorization (const std::string&);

  std::string
  base64_encode (const std::string&);

  enum class access_type
  {
    pull,
    push
  };

  std::string
  to_string (access_type);

  // Access a set of credentials must grant to a repository namespace.
  //
  struct namespace_access
  {
    std::string name;
    std::vector<access_type> types;

    // Comma-joined access types, e.g. "pull,push".
    //
    std::string
    types_string () const;

    // Token scope, e.g. "repository:library/default/alpine:pull".
    //
    std::string
    scope () const
    {
      return "repository:" + name + ':' + types_string ();
    }
  };
}
