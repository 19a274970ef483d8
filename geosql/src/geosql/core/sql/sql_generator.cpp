#include "geosql/core/sql/sql_generator.hpp"
#include "geosql/core/geometry/wkb_writer.hpp"
#include "geosql/core/geometry/wkt_writer.hpp"

namespace geosql {

namespace core {

//------------------------------------------------------------------------------
// SQLGenerator
//------------------------------------------------------------------------------
bool SQLGenerator::IsKnown(const string &name) {
	return StringUtil::CIEquals(name, "wkt") || StringUtil::CIEquals(name, "wkb");
}

unique_ptr<SQLGenerator> SQLGenerator::Create(const string &name) {
	if (StringUtil::CIEquals(name, "wkt")) {
		return make_uniq<WKTGenerator>();
	}
	if (StringUtil::CIEquals(name, "wkb")) {
		return make_uniq<WKBGenerator>();
	}
	throw InvalidInputException("Unknown SQL generator '%s', expected 'wkt' or 'wkb'", name);
}

string SQLGenerator::QuoteLiteral(const string &text) {
	return "'" + StringUtil::Replace(text, "'", "''") + "'";
}

//------------------------------------------------------------------------------
// WKTGenerator
//------------------------------------------------------------------------------
string WKTGenerator::ToGeometrySQL(const Geometry &geometry, const string &schema, int32_t srid) const {
	return StringUtil::Format("%s.ST_GeomFromText(%s, %d)", schema, QuoteLiteral(WKTWriter::Write(geometry)), srid);
}

string WKTGenerator::ToGeographySQL(const Geometry &geometry, const string &schema, int32_t srid) const {
	// The geography constructor takes a single EWKT argument
	auto ewkt = StringUtil::Format("SRID=%d;%s", srid, WKTWriter::Write(geometry));
	return StringUtil::Format("%s.ST_GeogFromText(%s)", schema, QuoteLiteral(ewkt));
}

//------------------------------------------------------------------------------
// WKBGenerator
//------------------------------------------------------------------------------
string WKBGenerator::ToGeometrySQL(const Geometry &geometry, const string &schema, int32_t srid) const {
	// The SRID is passed as an argument, keep it out of the blob
	WKBWriterOptions options;
	options.include_srid = false;
	return StringUtil::Format("%s.ST_GeomFromWKB(decode(%s, 'hex'), %d)", schema,
	                          QuoteLiteral(WKBWriter::WriteHex(geometry, options)), srid);
}

string WKBGenerator::ToGeographySQL(const Geometry &geometry, const string &schema, int32_t srid) const {
	// ST_GeogFromWKB takes no SRID argument, so it travels inside the EWKB
	WKBWriterOptions options;
	options.override_srid = true;
	options.srid = srid;
	return StringUtil::Format("%s.ST_GeogFromWKB(decode(%s, 'hex'))", schema,
	                          QuoteLiteral(WKBWriter::WriteHex(geometry, options)));
}

} // namespace core

} // namespace geosql
