#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include <boost/serialization/array.hpp>
#include <boost/serialization/split_member.hpp>

#include <fungible/protocol/account.hpp>
#include <fungible/protocol/event.hpp>
#include <fungible/token/error.hpp>

namespace fungible::token {

namespace event_name {

constexpr std::string_view transfer = "token.transfer";
constexpr std::string_view approval = "token.approval";

} // namespace event_name

/**
 * Emitted on every balance movement. `from` is empty when tokens enter
 * circulation at construction.
 */
struct transfer_event
{
  std::optional< protocol::account > from;
  std::optional< protocol::account > to;
  std::uint64_t value = 0;

  template< class Archive >
  void save( Archive& ar, const unsigned int version ) const
  {
    save_optional( ar, from );
    save_optional( ar, to );
    ar & value;
  }

  template< class Archive >
  void load( Archive& ar, const unsigned int version )
  {
    load_optional( ar, from );
    load_optional( ar, to );
    ar & value;
  }

  BOOST_SERIALIZATION_SPLIT_MEMBER()

  bool operator==( const transfer_event& ) const = default;

private:
  template< class Archive >
  static void save_optional( Archive& ar, const std::optional< protocol::account >& a )
  {
    bool present = a.has_value();
    ar & present;
    if( present )
      ar & *a;
  }

  template< class Archive >
  static void load_optional( Archive& ar, std::optional< protocol::account >& a )
  {
    bool present = false;
    ar & present;
    if( present )
    {
      protocol::account value{};
      ar & value;
      a = value;
    }
    else
      a.reset();
  }
};

struct approval_event
{
  protocol::account owner{};
  protocol::account spender{};
  std::uint64_t value = 0;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & owner;
    ar & spender;
    ar & value;
  }

  bool operator==( const approval_event& ) const = default;
};

protocol::event make_event( const transfer_event& ev, const protocol::account& source );
protocol::event make_event( const approval_event& ev, const protocol::account& source );

result< transfer_event > decode_transfer( const protocol::event& ev );
result< approval_event > decode_approval( const protocol::event& ev );

} // namespace fungible::token
