#include "mdhealth/merger.hh"


namespace {

	template<typename Stats> inline void add_counts(Stats& a, const Stats& b) noexcept {
		a.count+=b.count;
		a.instances+=b.instances;
	}

	void merge_subfield(mdhealth::subfield_stats& a, const mdhealth::subfield_stats& b) {
		add_counts(a, b);
		if(!b.values)
			return;
		if(!a.values)
			a.values.emplace();
		for(auto& [val, n]: *b.values)
			(*a.values)[val]+=n;
	}

	void merge_field(mdhealth::field_stats& a, const mdhealth::field_stats& b) {
		add_counts(a, b);
		for(auto& [name, sb]: b.subfields) {
			auto it=a.subfields.find(name);
			if(it==a.subfields.end())
				a.subfields.emplace(name, sb);
			else
				merge_subfield(it->second, sb);
		}
	}

}

void mdhealth::merge_into(stats_tree& a, const stats_tree& b) {
	a.record_count+=b.record_count;
	for(auto& [name, fb]: b.fields) {
		auto it=a.fields.find(name);
		if(it==a.fields.end())
			a.fields.emplace(name, fb);
		else
			merge_field(it->second, fb);
	}
	refresh_derived(a);
}

void mdhealth::merge_into(entity_stats& a, const entity_stats& b) {
	merge_into(a.summary, b.summary);
	for(auto& [rtype, tb]: b.by_resource_type) {
		auto it=a.by_resource_type.find(rtype);
		if(it==a.by_resource_type.end()) {
			auto& t=a.by_resource_type.emplace(rtype, tb).first->second;
			refresh_derived(t);
		} else {
			merge_into(it->second, tb);
		}
	}
}
