#include "mdhealth/schema.hh"

#include <algorithm>
#include <unordered_map>
#include <cstdint>

const std::string mdhealth::subfield_spec::other{"Other"};

const char* mdhealth::to_string(field_status st) noexcept {
	switch(st) {
		case field_status::mandatory:
			return "mandatory";
		case field_status::recommended:
			return "recommended";
		case field_status::optional:
			return "optional";
	}
	return "";
}

bool mdhealth::is_present(const nlohmann::json& v) noexcept {
	using value_t=nlohmann::json::value_t;
	switch(v.type()) {
		case value_t::null:
		case value_t::discarded:
			return false;
		case value_t::boolean:
			return v.get<bool>();
		case value_t::number_integer:
			return v.get<int64_t>()!=0;
		case value_t::number_unsigned:
			return v.get<uint64_t>()!=0;
		case value_t::number_float:
			return v.get<double>()!=0.0;
		case value_t::string:
			return !v.get_ref<const std::string&>().empty();
		case value_t::array:
		case value_t::object:
		case value_t::binary:
			return !v.empty();
	}
	return false;
}

const nlohmann::json* mdhealth::member(const nlohmann::json& obj, std::string_view key) noexcept {
	if(!obj.is_object())
		return nullptr;
	auto it=obj.find(key);
	if(it==obj.end())
		return nullptr;
	return &*it;
}

namespace {

	using mdhealth::subfield_spec;
	using json=nlohmann::json;
	using obs_list=std::vector<std::string_view>;

	inline std::string_view value_of(const json& v) noexcept {
		if(v.is_string())
			return v.get_ref<const std::string&>();
		return {};
	}

	/*! calls f for every present element, or once for a present non-list */
	template<typename F> inline void for_each_present(const json* v, F&& f) {
		if(!v || !mdhealth::is_present(*v))
			return;
		if(v->is_array()) {
			for(auto& e: *v) {
				if(mdhealth::is_present(e))
					f(e);
			}
		} else {
			f(*v);
		}
	}

	void extract_plain(const subfield_spec& spec, const json& occ, obs_list& out) {
		auto v=mdhealth::member(occ, spec.name);
		if(v && mdhealth::is_present(*v))
			out.push_back(value_of(*v));
	}

	/*! calls f for every element of list key whose id_key is present */
	template<typename F> inline void for_each_identified(const json& occ, std::string_view key, std::string_view id_key, F&& f) {
		for_each_present(mdhealth::member(occ, key), [id_key,&f](const json& e) {
			auto id=mdhealth::member(e, id_key);
			if(id && mdhealth::is_present(*id))
				f(e);
		});
	}

	void extract_name_identifier(const subfield_spec&, const json& occ, obs_list& out) {
		for_each_identified(occ, "nameIdentifiers", "nameIdentifier", [&out](const json&) {
			out.push_back({});
		});
	}
	void extract_name_identifier_scheme(const subfield_spec&, const json& occ, obs_list& out) {
		for_each_identified(occ, "nameIdentifiers", "nameIdentifier", [&out](const json& id) {
			auto scheme=mdhealth::member(id, "nameIdentifierScheme");
			if(scheme && mdhealth::is_present(*scheme))
				out.push_back(value_of(*scheme));
		});
	}

	void extract_affiliation(const subfield_spec&, const json& occ, obs_list& out) {
		for_each_present(mdhealth::member(occ, "affiliation"), [&out](const json&) {
			out.push_back({});
		});
	}
	void extract_affiliation_identifier(const subfield_spec&, const json& occ, obs_list& out) {
		for_each_identified(occ, "affiliation", "affiliationIdentifier", [&out](const json&) {
			out.push_back({});
		});
	}
	void extract_affiliation_identifier_scheme(const subfield_spec&, const json& occ, obs_list& out) {
		for_each_identified(occ, "affiliation", "affiliationIdentifier", [&out](const json& aff) {
			auto scheme=mdhealth::member(aff, "affiliationIdentifierScheme");
			if(scheme && mdhealth::is_present(*scheme))
				out.push_back(value_of(*scheme));
		});
	}

	/*! subfields not listed here are read from the key of the same name */
	const std::unordered_map<std::string_view, mdhealth::subfield_extractor> extractors{
		{"nameIdentifier", extract_name_identifier},
		{"nameIdentifierScheme", extract_name_identifier_scheme},
		{"affiliation", extract_affiliation},
		{"affiliationIdentifier", extract_affiliation_identifier},
		{"affiliationIdentifierScheme", extract_affiliation_identifier_scheme},
	};

}

mdhealth::subfield_spec::subfield_spec(std::string n, std::vector<std::string> vals):
	name{std::move(n)}, values{std::move(vals)}, has_other{false}, extract{extract_plain}
{
	has_other=std::find(values.begin(), values.end(), other)!=values.end();
	if(auto it=extractors.find(name); it!=extractors.end())
		extract=it->second;
}

const std::string* mdhealth::subfield_spec::classify(std::string_view v) const noexcept {
	for(auto& val: values) {
		if(val==v)
			return &val;
	}
	if(has_other)
		return &other;
	return nullptr;
}

mdhealth::schema::schema(std::vector<field_spec>&& fields, std::string routing_field, std::string routing_key):
	_fields{std::move(fields)}, _resource_types{}, _num_fields{0, 0, 0},
	_routing_idx{SIZE_MAX}, _routing_key{std::move(routing_key)}
{
	for(std::size_t i=0; i<_fields.size(); ++i) {
		auto& f=_fields[i];
		++_num_fields[static_cast<std::size_t>(f.status)];
		if(f.name!=routing_field)
			continue;
		_routing_idx=i;
		for(auto& sub: f.subfields) {
			if(sub.name==_routing_key)
				_resource_types=sub.values;
		}
	}
}

bool mdhealth::schema::is_resource_type(std::string_view v) const noexcept {
	for(auto& t: _resource_types) {
		if(t==v)
			return true;
	}
	return false;
}

namespace {

	std::vector<std::string> resource_type_general() {
		return {"Audiovisual", "Book", "BookChapter", "Collection",
			"ComputationalNotebook", "ConferencePaper", "ConferenceProceeding",
			"Dataset", "Dissertation", "Event", "Image", "InteractiveResource",
			"Journal", "JournalArticle", "Model", "OutputManagementPlan",
			"PeerReview", "PhysicalObject", "Preprint", "Report", "Service",
			"Software", "Sound", "Standard", "Text", "Workflow", "Other",
			"Unknown"};
	}

	/*! creators and contributors share everything but the type subfield */
	std::vector<subfield_spec> agent_subfields(subfield_spec&& type) {
		std::vector<subfield_spec> subs;
		subs.push_back(std::move(type));
		subs.emplace_back("nameIdentifier");
		subs.emplace_back("nameIdentifierScheme", std::vector<std::string>{"ORCID", "ROR", "ISNI"});
		subs.emplace_back("affiliation");
		subs.emplace_back("affiliationIdentifier");
		subs.emplace_back("affiliationIdentifierScheme", std::vector<std::string>{"ROR", "GRID", "ISNI"});
		return subs;
	}

	std::vector<mdhealth::field_spec> datacite_fields() {
		using mdhealth::field_spec;
		using mdhealth::field_shape;
		constexpr auto M=mdhealth::field_status::mandatory;
		constexpr auto R=mdhealth::field_status::recommended;
		constexpr auto O=mdhealth::field_status::optional;

		std::vector<field_spec> f;
		f.push_back({"identifier", "doi", M});
		f.push_back({"creators", "creators", M, field_shape::list, true,
				agent_subfields(subfield_spec{"nameType", {"Personal", "Organizational"}})});
		f.push_back({"titles", "titles", M});
		f.push_back({"publisher", "publisher", M});
		f.push_back({"publicationYear", "publicationYear", M});
		f.push_back({"resourceType", "types", M, field_shape::object, false, {
				subfield_spec{"resourceTypeGeneral", resource_type_general()},
				}});

		f.push_back({"subjects", "subjects", R});
		f.push_back({"contributors", "contributors", R, field_shape::list, true,
				agent_subfields(subfield_spec{"contributorType", {
					"ContactPerson", "DataCollector", "DataCurator", "DataManager",
					"Distributor", "Editor", "HostingInstitution", "Producer",
					"ProjectLeader", "ProjectManager", "ProjectMember", "RegistrationAgency",
					"RegistrationAuthority", "RelatedPerson", "Researcher", "ResearchGroup",
					"RightsHolder", "Sponsor", "Supervisor", "WorkPackageLeader", "Other"}})});
		f.push_back({"date", "dates", R});
		f.push_back({"relatedIdentifiers", "relatedIdentifiers", R, field_shape::list, true, {
				subfield_spec{"relationType", {"IsCitedBy", "Cites", "IsSupplementTo", "IsSupplementedBy",
					"IsContinuedBy", "Continues", "IsDescribedBy", "Describes",
					"HasMetadata", "IsMetadataFor", "HasVersion", "IsVersionOf",
					"IsNewVersionOf", "IsPreviousVersionOf", "IsPartOf", "HasPart",
					"IsPublishedIn", "IsReferencedBy", "References", "IsDocumentedBy",
					"Documents", "IsCompiledBy", "Compiles", "IsVariantFormOf",
					"IsOriginalFormOf", "IsIdenticalTo", "IsReviewedBy", "Reviews",
					"IsDerivedFrom", "IsSourceOf", "Requires", "IsRequiredBy",
					"Obsoletes", "IsObsoletedBy"}},
				subfield_spec{"relatedIdentifierType", {"ARK", "arXiv", "bibcode", "DOI", "EAN13", "EISSN",
					"Handle", "IGSN", "ISBN", "ISSN", "ISTC", "LISSN",
					"LSID", "PMID", "PURL", "UPC", "URL", "URN", "w3id"}},
				subfield_spec{"resourceTypeGeneral", resource_type_general()},
				}});
		f.push_back({"description", "descriptions", R});
		f.push_back({"geoLocations", "geoLocations", R});

		f.push_back({"language", "language", O});
		f.push_back({"alternateIdentifiers", "alternateIdentifiers", O});
		f.push_back({"sizes", "sizes", O});
		f.push_back({"formats", "formats", O});
		f.push_back({"version", "version", O});
		f.push_back({"rights", "rightsList", O});
		f.push_back({"fundingReferences", "fundingReferences", O, field_shape::list, true, {
				subfield_spec{"funderName"},
				subfield_spec{"funderIdentifier"},
				subfield_spec{"funderIdentifierType", {"Crossref Funder ID", "ROR", "Other"}},
				subfield_spec{"awardNumber"},
				subfield_spec{"awardURI"},
				subfield_spec{"awardTitle"},
				}});
		f.push_back({"relatedItems", "relatedItems", O});
		return f;
	}

}

const mdhealth::schema& mdhealth::schema::instance() {
	static const schema inst{datacite_fields(), "resourceType", "resourceTypeGeneral"};
	return inst;
}
