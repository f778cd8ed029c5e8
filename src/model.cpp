#include <regstore/model.hpp>

namespace regstore::model {

const Schema<Namespace>& NamespaceSchema() {
  static const Schema<Namespace> schema = [] {
    Schema<Namespace> s("Namespace");
    s.Field("Name", &Namespace::name)
        .Field("Comment", &Namespace::comment)
        .Field("Token", &Namespace::token)
        .Field("Owner", &Namespace::owner)
        .Field("Valid", &Namespace::valid)
        .Field("CreateTime", &Namespace::create_time)
        .Field("ModifyTime", &Namespace::modify_time);
    return s;
  }();
  return schema;
}

const Schema<Service>& ServiceSchema() {
  static const Schema<Service> schema = [] {
    Schema<Service> s("Service");
    s.Field("ID", &Service::id)
        .Field("Name", &Service::name)
        .Field("Namespace", &Service::namespace_name)
        .Field("Comment", &Service::comment)
        .Field("Token", &Service::token)
        .Field("Owner", &Service::owner)
        .Field("Meta", &Service::meta)
        .Field("Revision", &Service::revision)
        .Field("Valid", &Service::valid)
        .Field("CreateTime", &Service::create_time)
        .Field("ModifyTime", &Service::modify_time);
    return s;
  }();
  return schema;
}

const Schema<Location>& LocationSchema() {
  static const Schema<Location> schema = [] {
    Schema<Location> s("Location");
    s.Field("Proto", &Location::proto)
        .Field("RegionID", &Location::region_id)
        .Field("ZoneID", &Location::zone_id)
        .Field("CampusID", &Location::campus_id)
        .Field("Valid", &Location::valid);
    return s;
  }();
  return schema;
}

}  // namespace regstore::model
