#include "mdhealth/record.hh"

#include "mdhealth/utility.hh"


namespace {

	inline std::string_view string_at(const nlohmann::json* v) noexcept {
		if(v && v->is_string())
			return v->get_ref<const std::string&>();
		return {};
	}

	/*! relationships.<rel>.data.id */
	inline std::string_view relation_id(const nlohmann::json& item, std::string_view rel) noexcept {
		using mdhealth::member;
		auto rels=member(item, "relationships");
		if(!rels)
			return {};
		auto r=member(*rels, rel);
		if(!r)
			return {};
		auto data=member(*r, "data");
		if(!data)
			return {};
		return string_at(member(*data, "id"));
	}

	inline bool shape_ok(const nlohmann::json& v, mdhealth::field_shape shape) noexcept {
		switch(shape) {
			case mdhealth::field_shape::any:
				return true;
			case mdhealth::field_shape::list:
				return v.is_array();
			case mdhealth::field_shape::object:
				return v.is_object();
		}
		return false;
	}

}

mdhealth::record::record(const nlohmann::json& item, const schema& sch):
	_fields{}, _misshaped{0}, _id{}, _state{}, _client_id{}, _provider_id{}, _resource_type{}
{
	if(!item.is_object())
		report("record is not an object: ", item.type_name());

	const nlohmann::json* attrs=member(item, "attributes");
	if(!attrs || !attrs->is_object())
		attrs=&item;

	_id=string_at(member(item, "id"));
	if(_id.empty())
		_id=string_at(member(*attrs, "doi"));
	_state=string_at(member(*attrs, "state"));
	_client_id=relation_id(item, "client");
	_provider_id=relation_id(item, "provider");

	auto& specs=sch.fields();
	_fields.reserve(specs.size());
	for(std::size_t i=0; i<specs.size(); ++i) {
		auto& spec=specs[i];
		auto v=member(*attrs, spec.source);
		if(i==sch.routing_field() && v) {
			if(v->is_string())
				_resource_type=string_at(v);
			else
				_resource_type=string_at(member(*v, sch.routing_key()));
		}
		if(v && !is_present(*v))
			v=nullptr;
		if(v && !shape_ok(*v, spec.shape)) {
			print_warning("record ", _id, ": field `", spec.name,
					"' is a ", v->type_name(), ", skipped");
			++_misshaped;
			v=nullptr;
		}
		_fields.push_back(v);
	}
}
